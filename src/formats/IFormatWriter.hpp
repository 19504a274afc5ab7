/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>

#include "dataset/Dataset.hpp"

/// @brief アノテーションフォーマットの書き出しインターフェース
class IFormatWriter
{
public:
    virtual ~IFormatWriter(){};

    /// @brief targetPath にファイルを作成または上書きする
    /// 途中で失敗した場合、それまでに書いたファイルは残る
    virtual void Write(const Dataset &dataset, const std::string &targetPath) = 0;
};
