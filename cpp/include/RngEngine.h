#pragma once
#include <cstdint>
#include <string>

namespace ensemble {
    /**
     * @brief Small PCG random engine offering
     *   • Uniform [0,1)
     *   • named, reproducible sub-streams of a master seed
     */
    class RngEngine {
    public:
        /**
         * @param seed  Optional seed (default = time ^ thread_id).
         */
        explicit RngEngine(uint64_t seed = defaultSeed());

        /**
         * @brief Engine for an independent stream identified by `stream` under `seed`.
         *
         * The same (seed, stream) pair always yields the same sequence, regardless of
         * how many other streams were derived before it.
         */
        static RngEngine derive(uint64_t seed, const std::string& stream);

        /** @return a double ∈ [0,1) */
        double uniform();

        /** Default seed generator (clock ^ thread_id) */
        static uint64_t defaultSeed();

        /** @return next 32-bit uniform integer via PCG */
        uint32_t nextUInt32();

    private:
        // --- PCG state ---
        uint64_t state_;
        uint64_t increment_;
    };
}
