#include "Distribution.h"
#include "Error.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

#include <boost/math/distributions/lognormal.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/triangular.hpp>
#include <boost/math/distributions/uniform.hpp>

using namespace ensemble;

namespace {
    using Args = std::map<std::string, double>;

    constexpr double Z95 = 1.96;
    constexpr double kEdge = 1e-12;

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
        return s;
    }

    DistributionKind kindFromName(const std::string& name) {
        const std::string n = lower(name);
        if (n == "constant") return DistributionKind::Constant;
        if (n == "uniform") return DistributionKind::Uniform;
        if (n == "loguniform") return DistributionKind::LogUniform;
        if (n == "normal") return DistributionKind::Normal;
        if (n == "lognormal") return DistributionKind::Lognormal;
        if (n == "triangle" || n == "triangular") return DistributionKind::Triangle;
        if (n == "integers" || n == "integer") return DistributionKind::Integers;
        if (n == "grid") return DistributionKind::Grid;
        if (n == "sequence") return DistributionKind::Sequence;
        if (n == "binary") return DistributionKind::Binary;
        if (n == "linked") return DistributionKind::Linked;
        throw DistributionSpecError("Unknown distribution kind '" + name + "'");
    }

    std::string signatureText(const std::string& kind, const Args& args) {
        std::string s = kind + "(";
        bool first = true;
        for (const auto& kv : args) {
            if (!first) s += ", ";
            s += kv.first;
            first = false;
        }
        return s + ")";
    }

    void require(const bool ok, const std::string& what) {
        if (!ok) throw DistributionSpecError(what);
    }

    std::string num(const double v) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }

    // Lognormal(mu, sigma) from the linear-space mean and standard deviation.
    Distribution lognormalFromMoments(const double mean, const double stdev) {
        require(mean > 0.0, "Lognormal: mean must be > 0, got " + num(mean));
        require(stdev > 0.0, "Lognormal: stdev must be > 0, got " + num(stdev));
        const double var = stdev * stdev;
        const double m2 = mean * mean;
        const double mu = std::log(m2 / std::sqrt(var + m2));
        const double sigma = std::sqrt(std::log(var / m2 + 1.0));
        return Distribution::lognormal(mu, sigma);
    }

    Distribution lognormalFrom95(const double lo, const double hi) {
        require(lo > 0.0 && hi > lo, "Lognormal: need 0 < low95 < high95, got " + num(lo) + ", " + num(hi));
        const double mu = (std::log(lo) + std::log(hi)) / 2.0;
        const double sigma = (std::log(hi) - mu) / Z95;
        return Distribution::lognormal(mu, sigma);
    }

    struct Signature {
        DistributionKind kind;
        std::set<std::string> names;
        std::function<Distribution(const Args&)> build;
    };

    const std::vector<Signature>& signatures() {
        static const std::vector<Signature> table = {
            {DistributionKind::Constant, {"value"}, [](const Args& a) {
                return Distribution::constant(a.at("value"));
            }},
            {DistributionKind::Uniform, {"min", "max"}, [](const Args& a) {
                return Distribution::uniform(a.at("min"), a.at("max"));
            }},
            {DistributionKind::Uniform, {"factor"}, [](const Args& a) {
                const double f = a.at("factor");
                require(f >= 1.0, "Uniform(factor): factor must be >= 1, got " + num(f));
                return Distribution::uniform(1.0 / f, f);
            }},
            {DistributionKind::Uniform, {"range"}, [](const Args& a) {
                const double r = a.at("range");
                require(r >= 0.0, "Uniform(range): range must be >= 0, got " + num(r));
                return Distribution::uniform(1.0 - r, 1.0 + r);
            }},
            {DistributionKind::LogUniform, {"factor"}, [](const Args& a) {
                const double f = a.at("factor");
                require(f >= 1.0, "LogUniform(factor): factor must be >= 1, got " + num(f));
                return Distribution::logUniform(1.0 / f, f);
            }},
            {DistributionKind::LogUniform, {"min", "max"}, [](const Args& a) {
                return Distribution::logUniform(a.at("min"), a.at("max"));
            }},
            {DistributionKind::Normal, {"mean", "stdev"}, [](const Args& a) {
                return Distribution::normal(a.at("mean"), a.at("stdev"));
            }},
            {DistributionKind::Normal, {"mean", "std"}, [](const Args& a) {
                return Distribution::normal(a.at("mean"), a.at("std"));
            }},
            {DistributionKind::Lognormal, {"log_mean", "log_stdev"}, [](const Args& a) {
                return Distribution::lognormal(a.at("log_mean"), a.at("log_stdev"));
            }},
            {DistributionKind::Lognormal, {"norm_mean", "norm_stdev"}, [](const Args& a) {
                return lognormalFromMoments(a.at("norm_mean"), a.at("norm_stdev"));
            }},
            {DistributionKind::Lognormal, {"mean", "std"}, [](const Args& a) {
                return lognormalFromMoments(a.at("mean"), a.at("std"));
            }},
            {DistributionKind::Lognormal, {"mean", "stdev"}, [](const Args& a) {
                return lognormalFromMoments(a.at("mean"), a.at("stdev"));
            }},
            {DistributionKind::Lognormal, {"low95", "high95"}, [](const Args& a) {
                return lognormalFrom95(a.at("low95"), a.at("high95"));
            }},
            {DistributionKind::Lognormal, {"logfactor"}, [](const Args& a) {
                const double f = a.at("logfactor");
                require(f > 1.0, "Lognormal(logfactor): logfactor must be > 1, got " + num(f));
                return lognormalFrom95(1.0 / f, f);
            }},
            {DistributionKind::Triangle, {"min", "max", "mode"}, [](const Args& a) {
                return Distribution::triangle(a.at("min"), a.at("mode"), a.at("max"));
            }},
            {DistributionKind::Triangle, {"factor"}, [](const Args& a) {
                const double f = a.at("factor");
                require(f >= 0.0 && f <= 1.0, "Triangle(factor): factor must be in [0, 1], got " + num(f));
                return Distribution::triangle(1.0 - f, 1.0, 1.0 + f);
            }},
            {DistributionKind::Triangle, {"logfactor"}, [](const Args& a) {
                const double f = a.at("logfactor");
                require(f >= 1.0, "Triangle(logfactor): logfactor must be >= 1, got " + num(f));
                return Distribution::triangle(1.0 / f, 1.0, f);
            }},
            {DistributionKind::Triangle, {"range"}, [](const Args& a) {
                const double r = a.at("range");
                require(r > 0.0, "Triangle(range): range must be > 0, got " + num(r));
                return Distribution::triangle(-r, 0.0, r);
            }},
            {DistributionKind::Integers, {"min", "max"}, [](const Args& a) {
                const double lo = a.at("min"), hi = a.at("max");
                require(lo == std::floor(lo) && hi == std::floor(hi),
                        "Integers(min, max): bounds must be integral, got " + num(lo) + ", " + num(hi));
                return Distribution::integers(static_cast<int64_t>(lo), static_cast<int64_t>(hi));
            }},
            {DistributionKind::Grid, {"min", "max", "count"}, [](const Args& a) {
                const double count = a.at("count");
                require(count >= 1.0 && count == std::floor(count),
                        "Grid(count): count must be a positive integer, got " + num(count));
                return Distribution::grid(a.at("min"), a.at("max"), static_cast<int>(count));
            }},
            {DistributionKind::Binary, {}, [](const Args&) { return Distribution::binary(); }},
        };
        return table;
    }
}

const char* ensemble::toString(const DistributionKind kind) noexcept {
    switch (kind) {
        case DistributionKind::Constant: return "Constant";
        case DistributionKind::Uniform: return "Uniform";
        case DistributionKind::LogUniform: return "LogUniform";
        case DistributionKind::Normal: return "Normal";
        case DistributionKind::Lognormal: return "Lognormal";
        case DistributionKind::Triangle: return "Triangle";
        case DistributionKind::Integers: return "Integers";
        case DistributionKind::Grid: return "Grid";
        case DistributionKind::Sequence: return "Sequence";
        case DistributionKind::Binary: return "Binary";
        case DistributionKind::Linked: return "Linked";
    }
    return "Unknown";
}

Distribution::Distribution(const DistributionKind kind, const double a, const double b, const double c)
    : kind_(kind), a_(a), b_(b), c_(c) {}

//------------------------------------------------------------------------------
// fromArgs(): select the signature matching (kind, argument names)
//------------------------------------------------------------------------------
Distribution Distribution::fromArgs(const std::string& kind, const std::map<std::string, double>& args,
                                    const std::vector<double>& values, const std::string& linked) {
    const DistributionKind k = kindFromName(kind);

    if (k == DistributionKind::Sequence) {
        require(args.empty(), "Sequence takes only a value list, got " + signatureText(kind, args));
        return sequence(values);
    }
    if (k == DistributionKind::Linked) {
        require(args.empty(), "Linked takes only a parameter name, got " + signatureText(kind, args));
        return Distribution::linked(linked);
    }
    require(values.empty(), std::string(toString(k)) + " does not take a value list");

    Args normalized;
    for (const auto& kv : args) normalized[lower(kv.first)] = kv.second;

    for (const auto& sig : signatures()) {
        if (sig.kind != k || sig.names.size() != normalized.size()) continue;
        const bool match = std::all_of(normalized.begin(), normalized.end(),
                                       [&sig](const Args::value_type& kv) { return sig.names.count(kv.first) > 0; });
        if (match) return sig.build(normalized);
    }
    throw DistributionSpecError("Unknown distribution signature " + signatureText(toString(k), normalized));
}

Distribution Distribution::constant(const double value) {
    return Distribution(DistributionKind::Constant, value, 0.0, 0.0);
}

Distribution Distribution::uniform(const double min, const double max) {
    require(min <= max, "Uniform: min must be <= max, got " + num(min) + ", " + num(max));
    return Distribution(DistributionKind::Uniform, min, max, 0.0);
}

Distribution Distribution::logUniform(const double min, const double max) {
    require(min > 0.0 && min <= max, "LogUniform: need 0 < min <= max, got " + num(min) + ", " + num(max));
    return Distribution(DistributionKind::LogUniform, min, max, 0.0);
}

Distribution Distribution::normal(const double mean, const double stdev) {
    require(stdev > 0.0, "Normal: stdev must be > 0, got " + num(stdev));
    return Distribution(DistributionKind::Normal, mean, stdev, 0.0);
}

Distribution Distribution::lognormal(const double logMean, const double logStdev) {
    require(logStdev > 0.0, "Lognormal: log_stdev must be > 0, got " + num(logStdev));
    return Distribution(DistributionKind::Lognormal, logMean, logStdev, 0.0);
}

Distribution Distribution::triangle(double min, const double mode, double max) {
    if (min > max) std::swap(min, max);
    require(mode >= min && mode <= max,
            "Triangle: mode " + num(mode) + " lies outside [" + num(min) + ", " + num(max) + "]");
    return Distribution(DistributionKind::Triangle, min, mode, max);
}

Distribution Distribution::integers(const int64_t min, const int64_t max) {
    require(min <= max, "Integers: min must be <= max, got " + std::to_string(min) + ", " + std::to_string(max));
    return Distribution(DistributionKind::Integers, static_cast<double>(min), static_cast<double>(max), 0.0);
}

Distribution Distribution::grid(const double min, const double max, const int count) {
    require(count >= 1, "Grid: count must be >= 1, got " + std::to_string(count));
    require(min <= max, "Grid: min must be <= max, got " + num(min) + ", " + num(max));
    return Distribution(DistributionKind::Grid, min, max, count);
}

Distribution Distribution::sequence(std::vector<double> values) {
    require(!values.empty(), "Sequence: value list must not be empty");
    Distribution d(DistributionKind::Sequence, 0.0, 0.0, 0.0);
    d.values_ = std::move(values);
    return d;
}

Distribution Distribution::binary() {
    return Distribution(DistributionKind::Binary, 0.0, 1.0, 0.0);
}

Distribution Distribution::linked(const std::string& parameter) {
    require(!parameter.empty(), "Linked: parameter name must not be empty");
    Distribution d(DistributionKind::Linked, 0.0, 0.0, 0.0);
    d.linked_ = parameter;
    return d;
}

bool Distribution::isStochastic() const noexcept {
    switch (kind_) {
        case DistributionKind::Constant:
        case DistributionKind::Grid:
        case DistributionKind::Sequence:
        case DistributionKind::Linked:
            return false;
        default:
            return true;
    }
}

//------------------------------------------------------------------------------
// ppf(): inverse CDF at percentile u
//------------------------------------------------------------------------------
double Distribution::ppf(const double u) const {
    const double p = std::min(std::max(u, kEdge), 1.0 - kEdge);
    switch (kind_) {
        case DistributionKind::Uniform:
            if (a_ == b_) return a_;
            return boost::math::quantile(boost::math::uniform_distribution<>(a_, b_), p);
        case DistributionKind::LogUniform: {
            if (a_ == b_) return a_;
            const double lo = std::log(a_), hi = std::log(b_);
            return std::exp(lo + p * (hi - lo));
        }
        case DistributionKind::Normal:
            return boost::math::quantile(boost::math::normal_distribution<>(a_, b_), p);
        case DistributionKind::Lognormal:
            return boost::math::quantile(boost::math::lognormal_distribution<>(a_, b_), p);
        case DistributionKind::Triangle:
            if (a_ == c_) return a_;
            return boost::math::quantile(boost::math::triangular_distribution<>(a_, b_, c_), p);
        case DistributionKind::Integers:
            return std::min(std::floor(a_ + u * (b_ - a_ + 1.0)), b_);
        case DistributionKind::Binary:
            return u < 0.5 ? 0.0 : 1.0;
        default:
            throw std::logic_error(std::string("ppf: ") + toString(kind_) + " has no inverse CDF");
    }
}

double Distribution::sample(const SampleContext& ctx) const {
    switch (kind_) {
        case DistributionKind::Constant:
            return a_;
        case DistributionKind::Grid: {
            const auto count = static_cast<int64_t>(c_);
            if (count == 1) return a_;
            const auto step = ctx.trialNum % count;
            return a_ + static_cast<double>(step) * (b_ - a_) / static_cast<double>(count - 1);
        }
        case DistributionKind::Sequence:
            return values_[static_cast<size_t>(ctx.trialNum) % values_.size()];
        case DistributionKind::Linked:
            if (!ctx.linkedValue) throw std::logic_error("sample: no value source for linked parameter " + linked_);
            return ctx.linkedValue(linked_);
        default:
            return ppf(ctx.percentile);
    }
}

std::string Distribution::describe() const {
    std::ostringstream oss;
    oss << toString(kind_) << '(';
    switch (kind_) {
        case DistributionKind::Constant: oss << "value=" << a_; break;
        case DistributionKind::Uniform:
        case DistributionKind::LogUniform:
        case DistributionKind::Integers: oss << "min=" << a_ << ", max=" << b_; break;
        case DistributionKind::Normal: oss << "mean=" << a_ << ", stdev=" << b_; break;
        case DistributionKind::Lognormal: oss << "log_mean=" << a_ << ", log_stdev=" << b_; break;
        case DistributionKind::Triangle: oss << "min=" << a_ << ", mode=" << b_ << ", max=" << c_; break;
        case DistributionKind::Grid: oss << "min=" << a_ << ", max=" << b_ << ", count=" << c_; break;
        case DistributionKind::Sequence:
            oss << "values=[";
            for (size_t i = 0; i < values_.size(); ++i) oss << (i ? ", " : "") << values_[i];
            oss << ']';
            break;
        case DistributionKind::Binary: break;
        case DistributionKind::Linked: oss << "parameter=" << linked_; break;
    }
    oss << ')';
    return oss.str();
}
