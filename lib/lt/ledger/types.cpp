/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/types.hpp>

namespace ledger_turbo::ledger {
    static std::string_view json_hex(const json::value &j, const std::string_view name)
    {
        const auto &obj = j.as_object();
        const auto it = obj.find(name);
        if (it == obj.end())
            throw error("a JSON object is missing the required field {}: {}", name, json::serialize(j));
        return static_cast<std::string_view>(it->value().as_string());
    }

    tx_input tx_input::from_json(const json::value &j)
    {
        return { utxo_id::from_hex(json_hex(j, "outPoint")), signature::from_hex(json_hex(j, "signature")) };
    }

    json::object tx_input::to_json() const
    {
        return json::object {
            { "outPoint", fmt::format("{}", out_point) },
            { "signature", fmt::format("{}", sig) }
        };
    }

    void tx_input::to_cbor(cbor::encoder &enc) const
    {
        enc.array(2).bytes(out_point).bytes(sig);
    }

    tx_output tx_output::from_json(const json::value &j)
    {
        const auto &obj = j.as_object();
        const auto it = obj.find("value");
        if (it == obj.end())
            throw error("an output must have a value: {}", json::serialize(j));
        return { json::value_to_uint128(it->value()), public_key::from_hex(json_hex(j, "owner")) };
    }

    json::object tx_output::to_json() const
    {
        return json::object {
            { "value", value.str() },
            { "owner", fmt::format("{}", owner) }
        };
    }

    void tx_output::to_cbor(cbor::encoder &enc) const
    {
        enc.array(2).bigint(value).bytes(owner);
    }

    transaction transaction::from_json(const json::value &j)
    {
        transaction tx {};
        const auto &obj = j.as_object();
        if (const auto it = obj.find("inputs"); it != obj.end()) {
            for (const auto &in: it->value().as_array())
                tx.inputs.emplace_back(tx_input::from_json(in));
        }
        if (const auto it = obj.find("outputs"); it != obj.end()) {
            for (const auto &out: it->value().as_array())
                tx.outputs.emplace_back(tx_output::from_json(out));
        }
        return tx;
    }

    json::object transaction::to_json() const
    {
        json::array j_inputs {};
        for (const auto &in: inputs)
            j_inputs.emplace_back(in.to_json());
        json::array j_outputs {};
        for (const auto &out: outputs)
            j_outputs.emplace_back(out.to_json());
        return json::object {
            { "inputs", std::move(j_inputs) },
            { "outputs", std::move(j_outputs) }
        };
    }

    uint8_vector transaction::bytes() const
    {
        cbor::encoder enc {};
        enc.array(2);
        enc.array(inputs.size());
        for (const auto &in: inputs)
            in.to_cbor(enc);
        enc.array(outputs.size());
        for (const auto &out: outputs)
            out.to_cbor(enc);
        return std::move(enc.cbor());
    }

    uint8_vector transaction::signing_payload() const
    {
        transaction unsigned_tx { *this };
        for (auto &in: unsigned_tx.inputs)
            in.sig = signature {};
        return unsigned_tx.bytes();
    }

    signature transaction::sign(const buffer &sk) const
    {
        return ed25519::sign(signing_payload(), sk);
    }

    utxo_id tx_output_id(const buffer &tx_bytes, const uint64_t idx)
    {
        cbor::encoder enc {};
        enc.array(2).bytes(tx_bytes).uint(idx);
        return blake2b<utxo_id>(enc.cbor());
    }

    utxo_id genesis_output_id(const tx_output &out)
    {
        cbor::encoder enc {};
        out.to_cbor(enc);
        return blake2b<utxo_id>(enc.cbor());
    }

    utxo_id reward_output_id(const tx_output &out, const uint64_t block_height)
    {
        cbor::encoder enc {};
        enc.array(2);
        out.to_cbor(enc);
        enc.uint(block_height);
        return blake2b<utxo_id>(enc.cbor());
    }
}
