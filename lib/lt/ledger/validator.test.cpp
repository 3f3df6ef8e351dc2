/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

extern "C" {
#   include <sodium.h>
};
#include <algorithm>
#include <lt/ledger/fixture.hpp>

using namespace ledger_turbo;
using namespace ledger_turbo::ledger;

namespace {
    // a standard ed25519 signature whose nonce is derived from a fill byte instead of the message
    static ed25519::signature sign_with_nonce(const buffer &msg, const fixture::key_pair &kp, const uint8_t fill)
    {
        ed25519::ensure_initialized();
        secure_byte_array<64> az {};
        crypto_hash_sha512(az.data(), kp.sk.data(), 32);
        az[0] &= 248;
        az[31] &= 127;
        az[31] |= 64;
        secure_byte_array<64> a_wide {};
        std::copy_n(az.begin(), 32, a_wide.begin());
        secure_byte_array<32> a {};
        crypto_core_ed25519_scalar_reduce(a.data(), a_wide.data());

        byte_array<64> r_wide {};
        std::fill(r_wide.begin(), r_wide.end(), fill);
        secure_byte_array<32> r {};
        crypto_core_ed25519_scalar_reduce(r.data(), r_wide.data());

        ed25519::signature sig {};
        if (crypto_scalarmult_ed25519_base_noclamp(sig.data(), r.data()) != 0)
            throw error("failed to compute the nonce point");
        byte_array<64> h_wide {};
        crypto_hash_sha512_state st {};
        crypto_hash_sha512_init(&st);
        crypto_hash_sha512_update(&st, sig.data(), 32);
        crypto_hash_sha512_update(&st, kp.vk.data(), kp.vk.size());
        crypto_hash_sha512_update(&st, msg.data(), msg.size());
        crypto_hash_sha512_final(&st, h_wide.data());
        byte_array<32> h {};
        crypto_core_ed25519_scalar_reduce(h.data(), h_wide.data());

        secure_byte_array<32> ha {};
        crypto_core_ed25519_scalar_mul(ha.data(), h.data(), a.data());
        crypto_core_ed25519_scalar_add(sig.data() + 32, r.data(), ha.data());
        return sig;
    }

    static error_kind rejection(const validation_result &res)
    {
        if (const auto *rej = std::get_if<rejected>(&res))
            return rej->kind;
        throw error("expected a rejection but got {}", res);
    }
}

suite ledger_validator_suite = [] {
    "ledger::validator"_test = [] {
        const fixture::key_pair alice { "alice" };
        const fixture::key_pair bob { "bob" };
        "a valid spend"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id }, { tx_output { 60, bob.vk }, tx_output { 30, alice.vk } }, alice);
            const auto res = validate(tx, store);
            const auto *ok = std::get_if<fully_valid>(&res);
            expect((ok != nullptr) >> fatal) << fmt::format("{}", res);
            test_same(amount { 10 }, ok->reward);
            const auto bytes = tx.bytes();
            test_same(size_t { 2 }, ok->provides.size());
            test_same(tx_output_id(bytes, 0), ok->provides.at(0));
            test_same(tx_output_id(bytes, 1), ok->provides.at(1));
            test_same(size_t { 1 }, store.size());
        };
        "exact value transfer yields no reward"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto res = validate(fixture::make_tx({ id }, { tx_output { 100, bob.vk } }, alice), store);
            expect((std::holds_alternative<fully_valid>(res)) >> fatal);
            test_same(amount { 0 }, std::get<fully_valid>(res).reward);
        };
        "empty inputs and outputs"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            test_same(error_kind::empty_inputs, rejection(validate(transaction { {}, { tx_output { 1, bob.vk } } }, store)));
            test_same(error_kind::empty_outputs, rejection(validate(fixture::make_tx({ id }, {}, alice), store)));
            test_same(error_kind::empty_inputs, rejection(validate(transaction {}, store)));
        };
        "duplicate inputs"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id, id }, { tx_output { 100, bob.vk } }, alice);
            test_same(error_kind::duplicate_input, rejection(validate(tx, store)));
        };
        "duplicate outputs"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id }, { tx_output { 50, bob.vk }, tx_output { 50, bob.vk } }, alice);
            test_same(error_kind::duplicate_output, rejection(validate(tx, store)));
        };
        "the same out_point with two valid signatures"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            auto tx = fixture::make_tx({ id, id }, { tx_output { 200, bob.vk } }, alice);
            const auto payload = tx.signing_payload();
            tx.inputs[1].sig = sign_with_nonce(payload, alice, 0x5a);
            expect(tx.inputs[0].sig != tx.inputs[1].sig);
            expect((ed25519::verify(tx.inputs[0].sig, alice.vk, payload)) >> fatal);
            expect((ed25519::verify(tx.inputs[1].sig, alice.vk, payload)) >> fatal);
            const auto before = store;
            test_same(error_kind::duplicate_input, rejection(validate(tx, store)));
            state st { store };
            expect(std::holds_alternative<rejected>(st.spend(tx)));
            expect(store == before);
            test_same(amount { 0 }, store.reward());
        };
        "a signature by the wrong key"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id }, { tx_output { 100, bob.vk } }, bob);
            test_same(error_kind::invalid_signature, rejection(validate(tx, store)));
        };
        "tampering after signing"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            auto tx = fixture::make_tx({ id }, { tx_output { 90, bob.vk } }, alice);
            expect(std::holds_alternative<fully_valid>(validate(tx, store)));
            tx.outputs[0].value = 91;
            test_same(error_kind::invalid_signature, rejection(validate(tx, store)));
            tx.outputs[0].value = 90;
            tx.outputs[0].owner[31] ^= 0x80;
            test_same(error_kind::invalid_signature, rejection(validate(tx, store)));
        };
        "zero value outputs"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id }, { tx_output { 10, bob.vk }, tx_output { 0, bob.vk } }, alice);
            test_same(error_kind::zero_value_output, rejection(validate(tx, store)));
        };
        "output collision"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id }, { tx_output { 100, bob.vk } }, alice);
            store.put(tx_output_id(tx.bytes(), 0), tx_output { 1, alice.vk });
            test_same(error_kind::output_collision, rejection(validate(tx, store)));
        };
        "insufficient input value"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto before = store;
            const auto tx = fixture::make_tx({ id }, { tx_output { 150, bob.vk } }, alice);
            test_same(error_kind::insufficient_input_value, rejection(validate(tx, store)));
            expect(store == before);
        };
        "input overflow"_test = [&] {
            memory_store store {};
            const auto id1 = fixture::seed_one(store, uint128_max(), alice.vk);
            const auto id2 = fixture::seed_one(store, 1, alice.vk);
            const auto tx = fixture::make_tx({ id1, id2 }, { tx_output { 1, bob.vk } }, alice);
            test_same(error_kind::input_overflow, rejection(validate(tx, store)));
        };
        "output overflow"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto tx = fixture::make_tx({ id }, { tx_output { uint128_max(), bob.vk }, tx_output { 1, bob.vk } }, alice);
            test_same(error_kind::output_overflow, rejection(validate(tx, store)));
        };
        "missing inputs make a transaction pending"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto missing_id = utxo_id::from_hex(std::string(64, 'A'));
            const auto tx = fixture::make_tx({ id, missing_id }, { tx_output { 500, bob.vk } }, alice);
            const auto res = validate(tx, store);
            const auto *pend = std::get_if<pending>(&res);
            expect((pend != nullptr) >> fatal) << fmt::format("{}", res);
            test_same(size_t { 1 }, pend->required.size());
            expect(pend->required.contains(missing_id));
            test_same(size_t { 1 }, pend->provides.size());
            test_same(tx_output_id(tx.bytes(), 0), pend->provides.at(0));
        };
        "resolvable inputs of a pending transaction are still verified"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto missing_id = utxo_id::from_hex(std::string(64, 'A'));
            const auto tx = fixture::make_tx({ missing_id, id }, { tx_output { 100, bob.vk } }, bob);
            test_same(error_kind::invalid_signature, rejection(validate(tx, store)));
        };
        "a pending transaction becomes valid once its parent is present"_test = [&] {
            memory_store store {};
            const auto id = fixture::seed_one(store, 100, alice.vk);
            const auto parent = fixture::make_tx({ id }, { tx_output { 100, bob.vk } }, alice);
            const auto child = fixture::make_tx({ tx_output_id(parent.bytes(), 0) }, { tx_output { 99, alice.vk } }, bob);
            const auto child_res = validate(child, store);
            expect((std::holds_alternative<pending>(child_res)) >> fatal);
            const auto parent_res = validate(parent, store);
            expect((std::holds_alternative<fully_valid>(parent_res)) >> fatal);
            expect(std::get<pending>(child_res).required.contains(std::get<fully_valid>(parent_res).provides.at(0)));
            store.remove(id);
            store.put(std::get<fully_valid>(parent_res).provides.at(0), parent.outputs.at(0));
            const auto res = validate(child, store);
            expect((std::holds_alternative<fully_valid>(res)) >> fatal);
            test_same(amount { 1 }, std::get<fully_valid>(res).reward);
        };
    };
};
