/*
 * (c) 2021 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include "Types.hpp"

/// @brief Bboxに関連するユーティリティ関数を提供します。
/// 内部表現は常に BboxXyxy (絶対座標) で、他の形式はビューとして変換する。
/// 範囲外・幅ゼロのボックスもクリップせずにそのまま変換する。
namespace BboxUtil
{
    BboxCxcywh Xyxy2Cxcywh(const BboxXyxy input, const int imageWidth, const int imageHeight);
    BboxXyxy Cxcywh2Xyxy(const BboxCxcywh input, const int imageWidth, const int imageHeight);

    BboxXywh Xyxy2Xywh(const BboxXyxy input);
    BboxXyxy Xywh2Xyxy(const BboxXywh input);
}
