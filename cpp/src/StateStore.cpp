#include "StateStore.h"
#include "Error.h"
#include "Logging.h"

#include <chrono>
#include <sqlite3.h>

using namespace ensemble;

namespace {
    const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS simulation (
    simId       INTEGER PRIMARY KEY AUTOINCREMENT,
    name        TEXT NOT NULL,
    trialCount  INTEGER NOT NULL,
    description TEXT,
    seed        INTEGER NOT NULL DEFAULT 0,
    createdAt   INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS experiment (
    expId       INTEGER PRIMARY KEY AUTOINCREMENT,
    simId       INTEGER NOT NULL REFERENCES simulation(simId) ON DELETE CASCADE,
    name        TEXT NOT NULL,
    role        TEXT NOT NULL CHECK (role IN ('baseline', 'policy')),
    groupName   TEXT,
    description TEXT,
    UNIQUE (simId, name)
);
CREATE UNIQUE INDEX IF NOT EXISTS experiment_single_baseline ON experiment(simId) WHERE role = 'baseline';
CREATE TABLE IF NOT EXISTS trial (
    simId    INTEGER NOT NULL REFERENCES simulation(simId) ON DELETE CASCADE,
    trialNum INTEGER NOT NULL,
    PRIMARY KEY (simId, trialNum)
);
CREATE TABLE IF NOT EXISTS parameter (
    paramId      INTEGER PRIMARY KEY AUTOINCREMENT,
    simId        INTEGER NOT NULL REFERENCES simulation(simId) ON DELETE CASCADE,
    name         TEXT NOT NULL,
    distribution TEXT NOT NULL,
    mode         TEXT NOT NULL,
    apply        TEXT NOT NULL,
    lowBound     REAL,
    highBound    REAL,
    description  TEXT,
    UNIQUE (simId, name)
);
CREATE TABLE IF NOT EXISTS inputvalue (
    simId    INTEGER NOT NULL,
    trialNum INTEGER NOT NULL,
    paramId  INTEGER NOT NULL REFERENCES parameter(paramId) ON DELETE CASCADE,
    expId    INTEGER NOT NULL DEFAULT 0,
    value    REAL NOT NULL,
    PRIMARY KEY (simId, trialNum, paramId, expId),
    FOREIGN KEY (simId, trialNum) REFERENCES trial(simId, trialNum) ON DELETE CASCADE
);
CREATE TABLE IF NOT EXISTS run (
    runId      INTEGER PRIMARY KEY AUTOINCREMENT,
    simId      INTEGER NOT NULL,
    expId      INTEGER NOT NULL REFERENCES experiment(expId) ON DELETE CASCADE,
    trialNum   INTEGER NOT NULL,
    status     TEXT NOT NULL,
    workerId   TEXT,
    queuedAt   INTEGER,
    startedAt  INTEGER,
    endedAt    INTEGER,
    retryCount INTEGER NOT NULL DEFAULT 0,
    cause      TEXT,
    FOREIGN KEY (simId, trialNum) REFERENCES trial(simId, trialNum) ON DELETE CASCADE
);
CREATE UNIQUE INDEX IF NOT EXISTS run_single_active ON run(simId, expId, trialNum)
    WHERE status IN ('PENDING', 'QUEUED', 'RUNNING');
CREATE INDEX IF NOT EXISTS run_by_status ON run(simId, status);
CREATE TABLE IF NOT EXISTS output (
    outputId    INTEGER PRIMARY KEY AUTOINCREMENT,
    name        TEXT NOT NULL UNIQUE,
    description TEXT,
    units       TEXT
);
CREATE TABLE IF NOT EXISTS outputvalue (
    runId    INTEGER NOT NULL REFERENCES run(runId) ON DELETE CASCADE,
    outputId INTEGER NOT NULL REFERENCES output(outputId) ON DELETE CASCADE,
    value    REAL NOT NULL,
    PRIMARY KEY (runId, outputId)
);
CREATE TABLE IF NOT EXISTS timeseries (
    runId    INTEGER NOT NULL REFERENCES run(runId) ON DELETE CASCADE,
    outputId INTEGER NOT NULL REFERENCES output(outputId) ON DELETE CASCADE,
    region   TEXT NOT NULL,
    year     INTEGER NOT NULL,
    value    REAL NOT NULL,
    PRIMARY KEY (runId, outputId, region, year)
);
CREATE VIEW IF NOT EXISTS status AS
    SELECT r.simId, e.name AS expName, r.status, COUNT(*) AS count
    FROM run r JOIN experiment e ON e.expId = r.expId
    GROUP BY r.simId, e.name, r.status;
CREATE VIEW IF NOT EXISTS result AS
    SELECT r.simId, r.runId, e.name AS expName, r.trialNum, o.name AS resultName, v.value
    FROM outputvalue v
    JOIN run r ON r.runId = v.runId
    JOIN experiment e ON e.expId = r.expId
    JOIN output o ON o.outputId = v.outputId;
CREATE VIEW IF NOT EXISTS param AS
    SELECT i.simId, i.trialNum, p.name AS paramName, e.name AS expName, i.value
    FROM inputvalue i
    JOIN parameter p ON p.paramId = i.paramId
    LEFT JOIN experiment e ON e.expId = i.expId;
CREATE VIEW IF NOT EXISTS runinfo AS
    SELECT r.runId, r.simId, r.trialNum, e.name AS expName, e.role, r.status, r.workerId,
           r.queuedAt, r.startedAt, r.endedAt, r.endedAt - r.startedAt AS duration, r.retryCount, r.cause
    FROM run r JOIN experiment e ON e.expId = r.expId;
)SQL";

    const char* kRunColumns =
        "r.runId, r.simId, r.expId, e.name, e.role, r.trialNum, r.status, r.workerId, "
        "r.queuedAt, r.startedAt, r.endedAt, r.retryCount, r.cause";

    const char* kLatestAttempt =
        "r.runId = (SELECT MAX(x.runId) FROM run x WHERE x.simId = r.simId AND x.expId = r.expId "
        "AND x.trialNum = r.trialNum)";

    /**
     * @brief RAII prepared statement.
     */
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql) : db_(db) {
            if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
                throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_) + " in: " + sql);
        }

        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        Statement& bind(const int idx, const int v) { return check(sqlite3_bind_int(stmt_, idx, v)); }
        Statement& bind(const int idx, const int64_t v) { return check(sqlite3_bind_int64(stmt_, idx, v)); }
        Statement& bind(const int idx, const double v) { return check(sqlite3_bind_double(stmt_, idx, v)); }

        Statement& bind(const int idx, const std::string& v) {
            return check(sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT));
        }

        Statement& bind(const int idx, const std::optional<double>& v) {
            return v ? bind(idx, *v) : check(sqlite3_bind_null(stmt_, idx));
        }

        /** @return true while a row is available */
        bool step() {
            const int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW) return true;
            if (rc == SQLITE_DONE) return false;
            throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
        }

        void execute() {
            while (step()) {}
        }

        void reset() {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }

        int64_t int64(const int col) const { return sqlite3_column_int64(stmt_, col); }
        double real(const int col) const { return sqlite3_column_double(stmt_, col); }
        bool isNull(const int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

        std::string text(const int col) const {
            const auto* p = sqlite3_column_text(stmt_, col);
            return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
        }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_ = nullptr;

        Statement& check(const int rc) {
            if (rc != SQLITE_OK) throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
            return *this;
        }
    };

    RunRecord readRun(const Statement& st) {
        RunRecord r;
        r.runId = st.int64(0);
        r.simId = st.int64(1);
        r.expId = st.int64(2);
        r.experiment = st.text(3);
        r.role = experimentRoleFromString(st.text(4));
        r.trialNum = static_cast<int>(st.int64(5));
        r.status = runStatusFromString(st.text(6));
        r.workerId = st.text(7);
        r.queuedAt = st.int64(8);
        r.startedAt = st.int64(9);
        r.endedAt = st.int64(10);
        r.retryCount = static_cast<int>(st.int64(11));
        r.cause = st.text(12);
        return r;
    }

    std::string statusList(const std::vector<RunStatus>& statuses) {
        std::string s;
        for (const auto st : statuses) {
            if (!s.empty()) s += ", ";
            s += "'" + std::string(toString(st)) + "'";
        }
        return s.empty() ? "''" : s;
    }

    bool allowedTransition(const RunStatus from, const RunStatus to) {
        switch (from) {
            case RunStatus::PENDING: return to == RunStatus::QUEUED || to == RunStatus::ABORTED;
            case RunStatus::QUEUED:
                return to == RunStatus::RUNNING || to == RunStatus::PENDING || to == RunStatus::ABORTED;
            case RunStatus::RUNNING:
                return to == RunStatus::SUCCEEDED || to == RunStatus::FAILED || to == RunStatus::ABORTED;
            default: return false;
        }
    }
}

int64_t ensemble::systemMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

//------------------------------------------------------------------------------
// Connection
//------------------------------------------------------------------------------
StateStore::StateStore(const std::string& path, const int busyTimeoutMs) : path_(path), clock_(systemMillis) {
    const int rc = sqlite3_open_v2(path.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = std::string("Cannot open database ") + path + ": " + sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(msg);
    }
    sqlite3_busy_timeout(db_, busyTimeoutMs);

    try {
        exec("PRAGMA foreign_keys = ON;");
        exec("PRAGMA journal_mode = WAL;");
        exec("PRAGMA synchronous = NORMAL;");
        initSchema();
    }
    catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

StateStore::~StateStore() {
    if (db_) sqlite3_close(db_);
}

void StateStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError("SQL failed: " + msg);
    }
}

void StateStore::initSchema() {
    exec(kSchema);
}

StateStore::Transaction::Transaction(StateStore& store) : store_(store) {
    store_.exec("BEGIN IMMEDIATE;");
}

StateStore::Transaction::~Transaction() {
    if (done_) return;
    if (sqlite3_exec(store_.db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
        logError(std::string("Rollback failed: ") + sqlite3_errmsg(store_.db_));
}

void StateStore::Transaction::commit() {
    store_.exec("COMMIT;");
    done_ = true;
}

//------------------------------------------------------------------------------
// Simulation setup
//------------------------------------------------------------------------------
int64_t StateStore::createSimulation(const std::string& name, const int trialCount, const std::string& description,
                                     const uint64_t seed) {
    Statement st(db_, "INSERT INTO simulation (name, trialCount, description, seed, createdAt) VALUES (?, ?, ?, ?, ?)");
    st.bind(1, name).bind(2, trialCount).bind(3, description).bind(4, static_cast<int64_t>(seed)).bind(5, now());
    st.execute();
    return sqlite3_last_insert_rowid(db_);
}

std::optional<SimulationRecord> StateStore::simulation(const int64_t simId) const {
    Statement st(db_, "SELECT simId, name, trialCount, description, seed, createdAt FROM simulation WHERE simId = ?");
    st.bind(1, simId);
    if (!st.step()) return std::nullopt;
    return SimulationRecord{st.int64(0), st.text(1), static_cast<int>(st.int64(2)), st.text(3),
                            static_cast<uint64_t>(st.int64(4)), st.int64(5)};
}

int64_t StateStore::createExperiment(const int64_t simId, const Experiment& exp) {
    Statement st(db_, "INSERT INTO experiment (simId, name, role, groupName, description) VALUES (?, ?, ?, ?, ?)");
    st.bind(1, simId).bind(2, exp.name).bind(3, std::string(toString(exp.role))).bind(4, exp.group)
      .bind(5, exp.description);
    st.execute();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<Experiment> StateStore::experiments(const int64_t simId) const {
    Statement st(db_, "SELECT expId, name, role, groupName, description FROM experiment WHERE simId = ? "
                      "ORDER BY role = 'policy', expId");
    st.bind(1, simId);
    std::vector<Experiment> out;
    while (st.step()) {
        Experiment e;
        e.id = st.int64(0);
        e.name = st.text(1);
        e.role = experimentRoleFromString(st.text(2));
        e.group = st.text(3);
        e.description = st.text(4);
        out.push_back(std::move(e));
    }
    return out;
}

void StateStore::createTrials(const int64_t simId, const int trialCount) {
    Statement st(db_, "INSERT OR IGNORE INTO trial (simId, trialNum) VALUES (?, ?)");
    for (int t = 0; t < trialCount; ++t) {
        st.bind(1, simId).bind(2, t);
        st.execute();
        st.reset();
    }
}

int StateStore::trialCount(const int64_t simId) const {
    Statement st(db_, "SELECT COUNT(*) FROM trial WHERE simId = ?");
    st.bind(1, simId);
    st.step();
    return static_cast<int>(st.int64(0));
}

int64_t StateStore::saveParameter(const int64_t simId, const Parameter& param, const DrawMode effectiveMode) {
    {
        Statement st(db_, "INSERT OR IGNORE INTO parameter (simId, name, distribution, mode, apply, lowBound, "
                          "highBound, description) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        st.bind(1, simId).bind(2, param.name).bind(3, param.distribution.describe())
          .bind(4, std::string(toString(effectiveMode))).bind(5, param.apply).bind(6, param.lowBound)
          .bind(7, param.highBound).bind(8, param.description);
        st.execute();
    }
    Statement st(db_, "SELECT paramId FROM parameter WHERE simId = ? AND name = ?");
    st.bind(1, simId).bind(2, param.name);
    if (!st.step()) throw StoreError("Parameter " + param.name + " could not be saved");
    return st.int64(0);
}

std::map<std::string, int64_t> StateStore::parameterIds(const int64_t simId) const {
    Statement st(db_, "SELECT name, paramId FROM parameter WHERE simId = ?");
    st.bind(1, simId);
    std::map<std::string, int64_t> out;
    while (st.step()) out[st.text(0)] = st.int64(1);
    return out;
}

int64_t StateStore::insertInputValues(const int64_t simId, const std::vector<InputValue>& rows) {
    const auto params = parameterIds(simId);
    std::map<std::string, int64_t> exps;
    for (const auto& e : experiments(simId)) exps[e.name] = e.id;

    Statement st(db_, "INSERT OR IGNORE INTO inputvalue (simId, trialNum, paramId, expId, value) "
                      "VALUES (?, ?, ?, ?, ?)");
    int64_t written = 0;
    for (const auto& row : rows) {
        const auto p = params.find(row.parameter);
        if (p == params.end()) throw StoreError("Input value for unknown parameter " + row.parameter);
        int64_t expId = 0;
        if (!row.experiment.empty()) {
            const auto e = exps.find(row.experiment);
            if (e == exps.end()) throw StoreError("Input value for unknown experiment " + row.experiment);
            expId = e->second;
        }
        st.bind(1, simId).bind(2, row.trialNum).bind(3, p->second).bind(4, expId).bind(5, row.value);
        st.execute();
        written += sqlite3_changes(db_);
        st.reset();
    }
    return written;
}

std::vector<InputValue> StateStore::inputValues(const int64_t simId) const {
    Statement st(db_, "SELECT trialNum, paramName, COALESCE(expName, ''), value FROM param WHERE simId = ? "
                      "ORDER BY trialNum, paramName, expName");
    st.bind(1, simId);
    std::vector<InputValue> out;
    while (st.step())
        out.push_back({static_cast<int>(st.int64(0)), st.text(1), st.text(2), st.real(3)});
    return out;
}

std::vector<InputValue> StateStore::inputValues(const int64_t simId, const int trialNum) const {
    Statement st(db_, "SELECT trialNum, paramName, COALESCE(expName, ''), value FROM param "
                      "WHERE simId = ? AND trialNum = ? ORDER BY paramName, expName");
    st.bind(1, simId).bind(2, trialNum);
    std::vector<InputValue> out;
    while (st.step())
        out.push_back({static_cast<int>(st.int64(0)), st.text(1), st.text(2), st.real(3)});
    return out;
}

//------------------------------------------------------------------------------
// Runs
//------------------------------------------------------------------------------
int64_t StateStore::createRun(const int64_t simId, const int64_t expId, const int trialNum, const int retryCount) {
    Statement st(db_, "INSERT INTO run (simId, expId, trialNum, status, retryCount) VALUES (?, ?, ?, 'PENDING', ?)");
    st.bind(1, simId).bind(2, expId).bind(3, trialNum).bind(4, retryCount);
    st.execute();
    return sqlite3_last_insert_rowid(db_);
}

std::optional<RunRecord> StateStore::run(const int64_t runId) const {
    Statement st(db_, std::string("SELECT ") + kRunColumns +
                      " FROM run r JOIN experiment e ON e.expId = r.expId WHERE r.runId = ?");
    st.bind(1, runId);
    if (!st.step()) return std::nullopt;
    return readRun(st);
}

std::vector<RunRecord> StateStore::runs(const int64_t simId, const std::optional<RunStatus> status) const {
    std::string sql = std::string("SELECT ") + kRunColumns +
                      " FROM run r JOIN experiment e ON e.expId = r.expId WHERE r.simId = ?";
    if (status) sql += " AND r.status = ?";
    sql += " ORDER BY r.runId";
    Statement st(db_, sql);
    st.bind(1, simId);
    if (status) st.bind(2, std::string(toString(*status)));
    std::vector<RunRecord> out;
    while (st.step()) out.push_back(readRun(st));
    return out;
}

std::vector<RunRecord> StateStore::latestRuns(const int64_t simId) const {
    Statement st(db_, std::string("SELECT ") + kRunColumns +
                      " FROM run r JOIN experiment e ON e.expId = r.expId WHERE r.simId = ? AND " + kLatestAttempt +
                      " ORDER BY r.trialNum, e.role = 'policy', r.expId");
    st.bind(1, simId);
    std::vector<RunRecord> out;
    while (st.step()) out.push_back(readRun(st));
    return out;
}

namespace {
    /** The trial's newest baseline attempt has succeeded. */
    std::string baselineReady(const std::string& alias) {
        return "((SELECT b.status FROM run b JOIN experiment be ON be.expId = b.expId"
               " WHERE b.simId = " + alias + ".simId AND b.trialNum = " + alias + ".trialNum"
               " AND be.role = 'baseline' ORDER BY b.runId DESC LIMIT 1) = 'SUCCEEDED')";
    }
}

std::vector<RunRecord> StateStore::claimCandidates(const int64_t simId, const int limit) const {
    Statement st(db_, std::string("SELECT ") + kRunColumns +
                      " FROM run r JOIN experiment e ON e.expId = r.expId"
                      " WHERE r.simId = ? AND r.status = 'PENDING' AND (e.role = 'baseline' OR " +
                      baselineReady("r") + ")"
                      " ORDER BY e.role = 'policy', r.trialNum, r.runId LIMIT ?");
    st.bind(1, simId).bind(2, limit);
    std::vector<RunRecord> out;
    while (st.step()) out.push_back(readRun(st));
    return out;
}

bool StateStore::claimRun(const int64_t runId, const std::string& workerId) {
    Statement st(db_,
                 "UPDATE run SET status = 'QUEUED', workerId = ?, queuedAt = ?"
                 " WHERE runId = ? AND status = 'PENDING' AND ("
                 "   (SELECT role FROM experiment WHERE expId = run.expId) = 'baseline' OR " +
                 baselineReady("run") + ")");
    st.bind(1, workerId).bind(2, now()).bind(3, runId);
    st.execute();
    return sqlite3_changes(db_) == 1;
}

bool StateStore::transition(const int64_t runId, const RunStatus from, const RunStatus to, const std::string& cause) {
    if (!allowedTransition(from, to))
        throw StoreError(std::string("Illegal run transition ") + toString(from) + " -> " + toString(to));

    std::string stamp;
    if (to == RunStatus::QUEUED) stamp = ", queuedAt = ?";
    else if (to == RunStatus::RUNNING) stamp = ", startedAt = ?";
    else if (isTerminal(to)) stamp = ", endedAt = ?";
    const std::string release = to == RunStatus::PENDING ? ", workerId = NULL" : "";

    Statement st(db_, "UPDATE run SET status = ?, cause = COALESCE(NULLIF(?, ''), cause)" + stamp + release +
                      " WHERE runId = ? AND status = ?");
    st.bind(1, std::string(toString(to))).bind(2, cause);
    const int key = stamp.empty() ? 3 : 4;
    if (!stamp.empty()) st.bind(3, now());
    st.bind(key, runId).bind(key + 1, std::string(toString(from)));
    st.execute();
    return sqlite3_changes(db_) == 1;
}

int StateStore::abortDependents(const int64_t simId, const int trialNum, const std::string& cause) {
    Statement st(db_, "UPDATE run SET status = 'ABORTED', endedAt = ?, cause = ?"
                      " WHERE simId = ? AND trialNum = ? AND status IN ('PENDING', 'QUEUED')"
                      "   AND expId IN (SELECT expId FROM experiment WHERE simId = ? AND role = 'policy')");
    st.bind(1, now()).bind(2, cause).bind(3, simId).bind(4, trialNum).bind(5, simId);
    st.execute();
    return sqlite3_changes(db_);
}

int StateStore::abortActive(const int64_t simId, const std::string& cause, const bool includeRunning) {
    std::vector<RunStatus> statuses{RunStatus::PENDING, RunStatus::QUEUED};
    if (includeRunning) statuses.push_back(RunStatus::RUNNING);
    Statement st(db_, "UPDATE run SET status = 'ABORTED', endedAt = ?, cause = ? WHERE simId = ? AND status IN (" +
                      statusList(statuses) + ")");
    st.bind(1, now()).bind(2, cause).bind(3, simId);
    st.execute();
    return sqlite3_changes(db_);
}

std::vector<RunRecord> StateStore::timedOutRuns(const int64_t simId, const int64_t timeoutMs) const {
    Statement st(db_, std::string("SELECT ") + kRunColumns +
                      " FROM run r JOIN experiment e ON e.expId = r.expId"
                      " WHERE r.simId = ? AND r.status = 'RUNNING' AND r.startedAt < ? ORDER BY r.runId");
    st.bind(1, simId).bind(2, now() - timeoutMs);
    std::vector<RunRecord> out;
    while (st.step()) out.push_back(readRun(st));
    return out;
}

int64_t StateStore::countRuns(const int64_t simId, const std::vector<RunStatus>& statuses) const {
    Statement st(db_, "SELECT COUNT(*) FROM run WHERE simId = ? AND status IN (" + statusList(statuses) + ")");
    st.bind(1, simId);
    st.step();
    return st.int64(0);
}

std::vector<std::string> StateStore::busyWorkers(const int64_t simId) const {
    Statement st(db_, "SELECT DISTINCT workerId FROM run WHERE simId = ? AND status IN ('QUEUED', 'RUNNING')"
                      " AND workerId IS NOT NULL");
    st.bind(1, simId);
    std::vector<std::string> out;
    while (st.step()) out.push_back(st.text(0));
    return out;
}

std::vector<StatusCount> StateStore::statusSummary(const int64_t simId) const {
    Statement st(db_, std::string("SELECT e.name, r.status, COUNT(*) FROM run r JOIN experiment e ON e.expId = r.expId"
                                  " WHERE r.simId = ? AND ") + kLatestAttempt +
                      " GROUP BY e.name, r.status ORDER BY e.name, r.status");
    st.bind(1, simId);
    std::vector<StatusCount> out;
    while (st.step()) out.push_back({st.text(0), runStatusFromString(st.text(1)), st.int64(2)});
    return out;
}

std::vector<int> StateStore::trialsWithStatus(const int64_t simId, const std::vector<RunStatus>& statuses) const {
    Statement st(db_, std::string("SELECT DISTINCT r.trialNum FROM run r WHERE r.simId = ? AND ") + kLatestAttempt +
                      " AND r.status IN (" + statusList(statuses) + ") ORDER BY r.trialNum");
    st.bind(1, simId);
    std::vector<int> out;
    while (st.step()) out.push_back(static_cast<int>(st.int64(0)));
    return out;
}

//------------------------------------------------------------------------------
// Results
//------------------------------------------------------------------------------
int64_t StateStore::defineOutput(const std::string& name, const std::string& description, const std::string& units) {
    {
        Statement st(db_, "INSERT OR IGNORE INTO output (name, description, units) VALUES (?, ?, ?)");
        st.bind(1, name).bind(2, description).bind(3, units);
        st.execute();
    }
    Statement st(db_, "SELECT outputId FROM output WHERE name = ?");
    st.bind(1, name);
    if (!st.step()) throw StoreError("Output " + name + " could not be defined");
    return st.int64(0);
}

bool StateStore::saveOutputValue(const int64_t runId, const std::string& result, const double value) {
    const int64_t outputId = defineOutput(result);
    Statement st(db_, "INSERT OR IGNORE INTO outputvalue (runId, outputId, value) VALUES (?, ?, ?)");
    st.bind(1, runId).bind(2, outputId).bind(3, value);
    st.execute();
    return sqlite3_changes(db_) == 1;
}

std::optional<double> StateStore::outputValue(const int64_t runId, const std::string& result) const {
    Statement st(db_, "SELECT v.value FROM outputvalue v JOIN output o ON o.outputId = v.outputId"
                      " WHERE v.runId = ? AND o.name = ?");
    st.bind(1, runId).bind(2, result);
    if (!st.step()) return std::nullopt;
    return st.real(0);
}

void StateStore::saveTimeSeries(const int64_t runId, const std::string& result, const std::string& region,
                                const std::map<int, double>& series) {
    const int64_t outputId = defineOutput(result);
    Statement st(db_, "INSERT OR IGNORE INTO timeseries (runId, outputId, region, year, value) VALUES (?, ?, ?, ?, ?)");
    for (const auto& kv : series) {
        st.bind(1, runId).bind(2, outputId).bind(3, region).bind(4, kv.first).bind(5, kv.second);
        st.execute();
        st.reset();
    }
}

std::map<int, double> StateStore::timeSeries(const int64_t runId, const std::string& result) const {
    Statement st(db_, "SELECT t.year, SUM(t.value) FROM timeseries t JOIN output o ON o.outputId = t.outputId"
                      " WHERE t.runId = ? AND o.name = ? GROUP BY t.year ORDER BY t.year");
    st.bind(1, runId).bind(2, result);
    std::map<int, double> out;
    while (st.step()) out[static_cast<int>(st.int64(0))] = st.real(1);
    return out;
}

std::vector<OutputRecord> StateStore::results(const int64_t simId, const std::string& result) const {
    Statement st(db_, "SELECT runId, trialNum, expName, resultName, value FROM result"
                      " WHERE simId = ? AND resultName = ? ORDER BY trialNum, expName");
    st.bind(1, simId).bind(2, result);
    std::vector<OutputRecord> out;
    while (st.step())
        out.push_back({st.int64(0), static_cast<int>(st.int64(1)), st.text(2), st.text(3), st.real(4)});
    return out;
}
