/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_CBOR_ENCODER_HPP
#define LEDGER_TURBO_CBOR_ENCODER_HPP

#include <functional>
#include <limits>
#include <lt/big-int.hpp>
#include <lt/common/bytes.hpp>
#include <lt/cbor/types.hpp>

namespace ledger_turbo::cbor {
    // Produces definite-length encodings only, so equal values always have equal bytes
    struct encoder {
        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // a plain uint when the value fits 64 bits, a tagged positive bignum otherwise
        encoder &bigint(const uint128_t &val)
        {
            if (val <= std::numeric_limits<uint64_t>::max())
                return uint(static_cast<uint64_t>(val));
            tag(tag_positive_bignum);
            return bytes(uint128_to_bytes(val));
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size());
            _encode_data(sv);
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            _encode_uint_item(major_type::tag, id);
            return *this;
        }

        encoder &custom(const std::function<void(encoder &)> &gen)
        {
            gen(*this);
            return *this;
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_data(const buffer buf)
        {
            _buf << buf;
        }

        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, val);
            } else if (val <= std::numeric_limits<uint8_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::one_byte));
                _buf << static_cast<uint8_t>(val);
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes));
                _encode_data(buffer::from(host_to_net<uint16_t>(val)));
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes));
                _encode_data(buffer::from(host_to_net<uint32_t>(val)));
            } else {
                _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes));
                _encode_data(buffer::from(host_to_net<uint64_t>(val)));
            }
        }

        void _encode_item(const major_type typ, const uint8_t special)
        {
            _buf << static_cast<uint8_t>((static_cast<uint8_t>(typ) << 5) | (special & 0x1F));
        }
    };
}

#endif // !LEDGER_TURBO_CBOR_ENCODER_HPP
