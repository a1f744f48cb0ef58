/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_ADMISSION_CONTROLLER_HPP
#define EVORE_CRANK_CRANK_ADMISSION_CONTROLLER_HPP

#include <ec/crank/balance-calculator.hpp>
#include <ec/crank/completion-tracker.hpp>
#include <ec/crank/types.hpp>

namespace evore_crank::crank {
    struct admission {
        intent_list to_deploy {};
        intent_list to_checkpoint_only {};
        skip_list skips {};
    };

    struct admission_controller {
        admission_controller(const balance_calculator &calc, const completion_tracker &tracker):
            _calc { calc }, _tracker { tracker }
        {
        }

        // Deployers are evaluated in the order given; each ends up in exactly one of the three output lists.
        [[nodiscard]] admission evaluate(const deployer_view_list &views, uint64_t round_id, uint64_t amount_per_square, uint32_t squares_mask) const;
    private:
        const balance_calculator &_calc;
        const completion_tracker &_tracker;
    };
}

#endif // !EVORE_CRANK_CRANK_ADMISSION_CONTROLLER_HPP
