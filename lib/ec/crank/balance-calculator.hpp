/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_BALANCE_CALCULATOR_HPP
#define EVORE_CRANK_CRANK_BALANCE_CALCULATOR_HPP

#include <bit>
#include <ec/ledger/records.hpp>

namespace evore_crank::crank {
    static constexpr uint32_t squares_mask_all = 0x1FFFFFF;

    // Lamports that keep an account of the given data size rent-exempt.
    constexpr uint64_t rent_exempt_minimum(const size_t data_size)
    {
        return (128 + static_cast<uint64_t>(data_size)) * 3480 * 2;
    }

    constexpr size_t num_squares(const uint32_t mask)
    {
        return static_cast<size_t>(std::popcount(mask & squares_mask_all));
    }

    struct fee_schedule {
        uint64_t rent_exempt_reserve = rent_exempt_minimum(0);
        uint64_t checkpoint_fee = 10'000;
        uint64_t miner_rent = rent_exempt_minimum(ledger::miner_record::size);
        uint64_t deploy_fee = 500;
        // kept in the autodeploy balance account itself
        uint64_t balance_rent = rent_exempt_minimum(0);

        bool operator==(const fee_schedule &o) const =default;
    };

    struct balance_inputs {
        // the deployer's autodeploy balance
        uint64_t cached_balance = 0;
        // lamports already held by the managed miner authority
        uint64_t auth_balance = 0;
        bool miner_exists = false;
        uint64_t bps_fee = 0;
        uint64_t flat_fee = 0;
    };

    struct reserve {
        uint64_t deployed = 0;
        uint64_t required = 0;
        uint64_t shortfall = 0;
        // the deployer's fee and the protocol deploy fee, paid out of the autodeploy balance apart from the miner top-up
        uint64_t service_fee = 0;
        // what the autodeploy balance must hold for the deploy to execute: required, the service fee and its own rent
        uint64_t funding = 0;
        uint64_t funding_shortfall = 0;

        bool operator==(const reserve &o) const =default;
    };

    struct balance_calculator {
        explicit balance_calculator(const fee_schedule &fees={}): _fees { fees }
        {
        }

        [[nodiscard]] reserve required_reserve(const balance_inputs &in, uint64_t amount_per_square, uint32_t squares_mask) const;

        const fee_schedule &fees() const
        {
            return _fees;
        }
    private:
        const fee_schedule _fees;
    };

    // Remembers miner accounts once they have been observed so that later reads need not re-establish their existence.
    struct miner_probe_cache {
        bool exists(const ledger::pubkey &miner, bool observed)
        {
            if (_known.contains(miner))
                return true;
            if (observed)
                _known.emplace(miner);
            return observed;
        }

        size_t size() const
        {
            return _known.size();
        }
    private:
        set<ledger::pubkey> _known {};
    };

    extern uint64_t saturating_add(uint64_t a, uint64_t b) noexcept;
    extern uint64_t saturating_mul(uint64_t a, uint64_t b) noexcept;
}

#endif // !EVORE_CRANK_CRANK_BALANCE_CALCULATOR_HPP
