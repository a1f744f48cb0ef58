/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <ec/crank/balance-calculator.hpp>

namespace evore_crank::crank {
    uint64_t saturating_add(const uint64_t a, const uint64_t b) noexcept
    {
        const uint64_t res = a + b;
        return res < a ? std::numeric_limits<uint64_t>::max() : res;
    }

    uint64_t saturating_mul(const uint64_t a, const uint64_t b) noexcept
    {
        if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a)
            return std::numeric_limits<uint64_t>::max();
        return a * b;
    }

    reserve balance_calculator::required_reserve(const balance_inputs &in, const uint64_t amount_per_square, const uint32_t squares_mask) const
    {
        reserve res {};
        res.deployed = saturating_mul(amount_per_square, num_squares(squares_mask));
        uint64_t gross = saturating_add(_fees.rent_exempt_reserve, _fees.checkpoint_fee);
        gross = saturating_add(gross, res.deployed);
        if (!in.miner_exists)
            gross = saturating_add(gross, _fees.miner_rent);
        res.required = gross > in.auth_balance ? gross - in.auth_balance : 0;
        res.shortfall = res.required > in.cached_balance ? res.required - in.cached_balance : 0;
        res.service_fee = saturating_add(saturating_add(saturating_mul(res.deployed, in.bps_fee) / 10'000, in.flat_fee), _fees.deploy_fee);
        res.funding = saturating_add(saturating_add(res.required, res.service_fee), _fees.balance_rent);
        res.funding_shortfall = res.funding > in.cached_balance ? res.funding - in.cached_balance : 0;
        return res;
    }
}
