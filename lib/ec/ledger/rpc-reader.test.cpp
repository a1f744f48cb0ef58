/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/ledger/rpc-reader.hpp>

using namespace evore_crank;
using namespace evore_crank::ledger;

suite ledger_rpc_reader_suite = [] {
    "ledger::rpc_reader"_test = [] {
        "parse_account"_test = [] {
            const auto acc = parse_account(json::parse(std::string_view {
                R"({"lamports":1500,"owner":"11111111111111111111111111111111","data":["AQID","base64"],"executable":false,"rentEpoch":0})"
            }));
            expect(fatal(acc.has_value()));
            test_same(uint64_t { 1500 }, acc->lamports);
            test_same(program::system(), acc->owner);
            test_same(uint8_vector::from_hex("010203"), acc->data);
            expect(!parse_account(json::value {}).has_value());
            expect(throws([] {
                parse_account(json::parse(std::string_view { R"({"lamports":1,"owner":"11111111111111111111111111111111","data":["AQID","base58"]})" }));
            }));
        };
        "parse_signature_status"_test = [] {
            test_same(confirmation_status::pending, parse_signature_status(json::value {}));
            test_same(confirmation_status::pending, parse_signature_status(json::parse(std::string_view { R"({"err":null,"confirmationStatus":"processed"})" })));
            test_same(confirmation_status::confirmed, parse_signature_status(json::parse(std::string_view { R"({"err":null,"confirmationStatus":"confirmed"})" })));
            test_same(confirmation_status::confirmed, parse_signature_status(json::parse(std::string_view { R"({"err":null,"confirmationStatus":"finalized"})" })));
            test_same(confirmation_status::failed, parse_signature_status(json::parse(std::string_view { R"({"err":{"InstructionError":[2,"Custom"]},"confirmationStatus":"confirmed"})" })));
        };
    };
};
