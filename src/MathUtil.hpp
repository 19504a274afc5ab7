/*
 * (c) 2022 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <cmath>

/// @brief 数学に関連するユーティリティ
namespace MathUtil
{
    /// @brief 小数点以下 digits 桁に丸める
    inline double RoundTo(const double value, const int digits)
    {
        const double scale = std::pow(10.0, digits);
        return std::round(value * scale) / scale;
    }
}
