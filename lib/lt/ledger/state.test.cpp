/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/fixture.hpp>

using namespace ledger_turbo;
using namespace ledger_turbo::ledger;

suite ledger_state_suite = [] {
    "ledger::state"_test = [] {
        const fixture::key_pair alice { "alice" };
        const fixture::key_pair bob { "bob" };
        const fixture::key_pair carol { "carol" };
        const genesis g { { tx_output { 100, alice.vk } } };
        const auto genesis_id = genesis_output_id(g.utxos.at(0));
        "scenario: a full transfer"_test = [&] {
            memory_store store {};
            state st { store };
            st.seed(g);
            const auto tx = fixture::make_tx({ genesis_id }, { tx_output { 100, bob.vk } }, alice);
            const auto res = st.spend(tx);
            expect((std::holds_alternative<fully_valid>(res)) >> fatal);
            test_same(amount { 0 }, std::get<fully_valid>(res).reward);
            test_same(size_t { 1 }, store.size());
            test_same(tx_output { 100, bob.vk }, *store.get(tx_output_id(tx.bytes(), 0)));
            test_same(uint64_t { 1 }, st.num_committed());
        };
        "scenario: spending more than the inputs"_test = [&] {
            memory_store store {};
            state st { store };
            st.seed(g);
            const auto before = store;
            const auto res = st.spend(fixture::make_tx({ genesis_id }, { tx_output { 150, bob.vk } }, alice));
            test_same(error_kind::insufficient_input_value, std::get<rejected>(res).kind);
            expect(store == before);
        };
        "scenario: the same input twice"_test = [&] {
            memory_store store {};
            state st { store };
            st.seed(g);
            const auto res = st.spend(fixture::make_tx({ genesis_id, genesis_id }, { tx_output { 100, bob.vk } }, alice));
            test_same(error_kind::duplicate_input, std::get<rejected>(res).kind);
        };
        "scenario: an unknown input"_test = [&] {
            memory_store store {};
            state st { store };
            st.seed(g);
            const auto before = store;
            const auto res = st.spend(fixture::make_tx({ utxo_id::from_hex(std::string(64, 'B')) }, { tx_output { 1, bob.vk } }, alice));
            expect(std::holds_alternative<pending>(res));
            expect(store == before);
            test_same(uint64_t { 0 }, st.num_committed());
        };
        "a block of transactions followed by finalization"_test = [&] {
            memory_store store {};
            state st { store };
            st.seed(g);
            vector<transaction> notified {};
            const tx_processor proc { .on_tx_success = [&](const auto &tx) { notified.emplace_back(tx); } };
            st.register_processor(proc);
            const auto tx1 = fixture::make_tx({ genesis_id }, { tx_output { 90, bob.vk } }, alice);
            const auto tx2 = fixture::make_tx({ tx_output_id(tx1.bytes(), 0) }, { tx_output { 85, carol.vk } }, bob);
            // the child arrives first and waits for its parent
            expect(std::holds_alternative<pending>(st.spend(tx2)));
            expect(std::holds_alternative<fully_valid>(st.spend(tx1)));
            expect(std::holds_alternative<fully_valid>(st.spend(tx2)));
            test_same(size_t { 2 }, notified.size());
            test_same(amount { 15 }, st.reward());
            const auto dist = st.finalize({ alice.vk, bob.vk }, 1);
            test_same(amount { 7 }, std::get<distributed>(dist).share);
            test_same(amount { 1 }, st.reward());
            test_same(size_t { 3 }, st.utxos().size());
            amount total {};
            st.utxos().foreach([&](const auto &, const auto &out) {
                total += out.value;
            });
            test_same(amount { 100 }, total + st.reward());
            st.remove_processor(proc);
            expect(std::holds_alternative<pending>(st.spend(tx1)));
            test_same(size_t { 2 }, notified.size());
        };
        "finalization without authorities keeps the pool"_test = [&] {
            memory_store store {};
            state st { store };
            st.seed(g);
            expect(std::holds_alternative<fully_valid>(st.spend(fixture::make_tx({ genesis_id }, { tx_output { 95, bob.vk } }, alice))));
            expect(std::holds_alternative<distribution_skipped>(st.finalize({}, 1)));
            test_same(amount { 5 }, st.reward());
        };
    };
};
