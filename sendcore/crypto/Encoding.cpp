/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace sendcore {

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size());

    for (auto byte: data)
    {
        out += base16Sym[byte >> 4];
        out += base16Sym[byte & 0xf];
    }
    return out;
}

static int
base16Value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + c - 'a';
    if ('A' <= c && c <= 'F')
        return 10 + c - 'A';
    return -1;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 2 characters long:
    if (in.size() % 2)
        return SC_ERROR(SC_CC_ParseError, "Bad hex length");

    DataChunk out;
    out.reserve(in.size() / 2);

    for (size_t i = 0; i < in.size(); i += 2)
    {
        int high = base16Value(in[i]);
        int low = base16Value(in[i + 1]);
        if (high < 0 || low < 0)
            return SC_ERROR(SC_CC_ParseError, "Bad hex character");
        out.push_back(high << 4 | low);
    }

    result = std::move(out);
    return Status();
}

std::string
base64Encode(DataSlice data)
{
    if (data.empty())
        return std::string();

    std::string out;
    out.resize(4 * ((data.size() + 2) / 3) + 1); // Room for the null byte
    int size = EVP_EncodeBlock(
        reinterpret_cast<unsigned char *>(&out[0]),
        data.data(), data.size());
    out.resize(size);
    return out;
}

static bool
base64IsSymbol(char c)
{
    return ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z') ||
        ('0' <= c && c <= '9') || '+' == c || '/' == c;
}

Status
base64Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 4 characters long:
    if (in.size() % 4)
        return SC_ERROR(SC_CC_ParseError, "Bad base64 length");

    // Up to two '=' signs are allowed, and only at the end:
    size_t padding = 0;
    while (padding < in.size() && '=' == in[in.size() - 1 - padding])
        ++padding;
    if (2 < padding)
        return SC_ERROR(SC_CC_ParseError, "Bad base64 padding");
    if (!std::all_of(in.begin(), in.end() - padding, base64IsSymbol))
        return SC_ERROR(SC_CC_ParseError, "Bad base64 character");

    if (in.empty())
    {
        result.clear();
        return Status();
    }

    // OpenSSL decodes padding as zero bytes, so strip them afterwards:
    DataChunk out(3 * (in.size() / 4));
    int size = EVP_DecodeBlock(out.data(),
        reinterpret_cast<const unsigned char *>(in.data()), in.size());
    if (size < 0 || static_cast<size_t>(size) < padding)
        return SC_ERROR(SC_CC_ParseError, "Bad base64 data");
    out.resize(size - padding);

    result = std::move(out);
    return Status();
}

} // namespace sendcore
