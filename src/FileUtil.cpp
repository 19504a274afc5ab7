/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "FileUtil.hpp"

#include <algorithm>
#include <filesystem>
#include <opencv2/opencv.hpp>

namespace fs = std::filesystem;

std::string FileUtil::GetStem(const std::string &filePath)
{
    // strip extension
    const std::string fileName = GetFileName(filePath);
    const size_t pos = fileName.rfind('.');
    if (pos == std::string::npos || pos == 0)
    {
        return fileName;
    }
    return fileName.substr(0, pos);
}

std::string FileUtil::GetFileName(const std::string &filePath)
{
    // strip dir name
    const size_t pos = filePath.find_last_of("/\\");
    if (pos == std::string::npos)
    {
        return filePath;
    }
    else
    {
        return filePath.substr(pos + 1);
    }
}

bool FileUtil::IsDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool FileUtil::IsRegularFile(const std::string &path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtil::IsSameFile(const std::string &path1, const std::string &path2)
{
    std::error_code ec;
    const bool same = fs::equivalent(path1, path2, ec);
    return !ec && same;
}

std::vector<std::string> FileUtil::GetFilesWithExtension(const std::string &directoryPath, const std::string &extension)
{
    std::vector<std::string> files;
    std::error_code ec;
    for (const fs::directory_entry &entry : fs::directory_iterator(directoryPath, ec))
    {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension().string() != extension) continue;
        files.push_back(entry.path().string());
    }

    // directory_iterator の順序は不定なので名前順に揃える
    std::sort(files.begin(), files.end());
    return files;
}

bool FileUtil::CreateDirectories(const std::string &directoryPath)
{
    if (directoryPath.empty()) return true;

    std::error_code ec;
    fs::create_directories(directoryPath, ec);
    return !ec && fs::is_directory(directoryPath, ec);
}

bool FileUtil::CreateParentDirectories(const std::string &filePath)
{
    return CreateDirectories(fs::path(filePath).parent_path().string());
}

std::string FileUtil::FindImageFile(const std::string &imagesDir, const std::string &stem, const std::string &preferredExt)
{
    static const std::vector<std::string> commonExts = {".jpg", ".jpeg", ".png", ".bmp", ".JPG", ".JPEG", ".PNG", ".BMP"};

    std::vector<std::string> candidates = {preferredExt};
    candidates.insert(candidates.end(), commonExts.begin(), commonExts.end());

    for (const std::string &ext : candidates)
    {
        const std::string imagePath = (fs::path(imagesDir) / (stem + ext)).string();
        if (IsRegularFile(imagePath))
        {
            return imagePath;
        }
    }
    return "";
}

bool FileUtil::ReadImageSize(const std::string &imagePath, int &width, int &height)
{
    const cv::Mat image = cv::imread(imagePath, cv::IMREAD_UNCHANGED);
    if (image.empty())
    {
        return false;
    }
    width = image.cols;
    height = image.rows;
    return true;
}
