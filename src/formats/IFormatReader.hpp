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

/// @brief アノテーションフォーマットの読み込みインターフェース
/// 補助入力 (画像ディレクトリ、classes.txt など) は各実装のコンストラクタで受け取る
class IFormatReader
{
public:
    virtual ~IFormatReader(){};

    /// @brief sourcePath から Dataset を構築する。失敗時は AnnotationError の派生クラスを投げる
    virtual Dataset Read(const std::string &sourcePath) = 0;
};
