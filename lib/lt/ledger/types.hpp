/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_TYPES_HPP
#define LEDGER_TURBO_LEDGER_TYPES_HPP

#include <lt/big-int.hpp>
#include <lt/blake2b.hpp>
#include <lt/cbor/encoder.hpp>
#include <lt/container.hpp>
#include <lt/ed25519.hpp>
#include <lt/json.hpp>

namespace ledger_turbo::ledger {
    using utxo_id = blake2b_256_hash;
    using utxo_id_set = flat_set<utxo_id>;
    using public_key = ed25519::vkey;
    using signature = ed25519::signature;
    using amount = uint128_t;

    struct tx_input {
        utxo_id out_point {};
        signature sig {};

        static tx_input from_json(const json::value &j);
        json::object to_json() const;
        void to_cbor(cbor::encoder &enc) const;

        std::strong_ordering operator<=>(const tx_input &o) const
        {
            if (const auto cmp = out_point <=> o.out_point; cmp != std::strong_ordering::equal)
                return cmp;
            return sig <=> o.sig;
        }

        bool operator==(const tx_input &o) const
        {
            return out_point == o.out_point && sig == o.sig;
        }
    };
    using tx_input_list = vector<tx_input>;

    struct tx_output {
        amount value {};
        public_key owner {};

        static tx_output from_json(const json::value &j);
        json::object to_json() const;
        void to_cbor(cbor::encoder &enc) const;

        std::strong_ordering operator<=>(const tx_output &o) const
        {
            if (value < o.value)
                return std::strong_ordering::less;
            if (value > o.value)
                return std::strong_ordering::greater;
            return owner <=> o.owner;
        }

        bool operator==(const tx_output &o) const
        {
            return value == o.value && owner == o.owner;
        }
    };
    using tx_output_list = vector<tx_output>;

    struct transaction {
        tx_input_list inputs {};
        tx_output_list outputs {};

        static transaction from_json(const json::value &j);
        json::object to_json() const;

        // canonical encoding: [ [* [out_point, signature]], [* [value, owner]] ]
        uint8_vector bytes() const;
        // the canonical encoding of a copy with all input signatures zeroed
        uint8_vector signing_payload() const;
        // a signature of the signing payload, so the same value is valid for every input owned by sk
        signature sign(const buffer &sk) const;

        bool operator==(const transaction &o) const =default;
    };

    // id of the output at idx of a transaction with the canonical encoding tx_bytes
    extern utxo_id tx_output_id(const buffer &tx_bytes, uint64_t idx);
    // id of a genesis output, depends only on the output's own content
    extern utxo_id genesis_output_id(const tx_output &out);
    // id of an authority payout minted at a given block height
    extern utxo_id reward_output_id(const tx_output &out, uint64_t block_height);
}

namespace fmt {
    template<>
    struct formatter<ledger_turbo::ledger::tx_input>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.out_point);
        }
    };

    template<>
    struct formatter<ledger_turbo::ledger::tx_output>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({} to {})", v.value, v.owner);
        }
    };

    template<>
    struct formatter<ledger_turbo::ledger::transaction>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "inputs: {} outputs: {}", v.inputs, v.outputs);
        }
    };
}

#endif // !LEDGER_TURBO_LEDGER_TYPES_HPP
