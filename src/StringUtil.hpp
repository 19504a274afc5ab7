/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

/// @brief 文字列に関連するユーティリティ
namespace StringUtil
{
    inline std::string Trim(const std::string &input)
    {
        const char *whitespace = " \t\r\n";
        const size_t begin = input.find_first_not_of(whitespace);
        if (begin == std::string::npos) return "";
        const size_t end = input.find_last_not_of(whitespace);
        return input.substr(begin, end - begin + 1);
    }

    inline std::string ToLower(const std::string &input)
    {
        std::string ret = input;
        std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) { return std::tolower(c); });
        return ret;
    }

    /// @brief 文字列全体が数値として解釈できる場合のみ true
    inline bool ParseDouble(const std::string &token, double &value)
    {
        char *end = nullptr;
        value = std::strtod(token.c_str(), &end);
        return end != token.c_str() && *end == '\0';
    }

    /// @brief 文字列全体が int に収まる10進整数として解釈できる場合のみ true
    inline bool ParseInt(const std::string &token, int &value)
    {
        char *end = nullptr;
        errno = 0;
        const long parsed = std::strtol(token.c_str(), &end, 10);
        if (end == token.c_str() || *end != '\0') return false;
        if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) return false;
        value = (int)parsed;
        return true;
    }
}
