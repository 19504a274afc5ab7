/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <algorithm>
#include <cstdlib>
#include <gflags/gflags.h>
#include <iostream>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "pipeline/Converter.hpp"

static const char *kVersion = "0.1.0";

// Define and parser command line arguments
DEFINE_string(input, "", "Input path (file for COCO, directory for YOLO/VOC)");
DEFINE_string(i, "", "Short for --input");
DEFINE_string(output, "", "Output path (file for COCO, directory for YOLO/VOC)");
DEFINE_string(o, "", "Short for --output");
DEFINE_string(images, "", "Images directory (required for YOLO as source)");
DEFINE_string(classes, "", "Classes file path (required for YOLO as source)");
DEFINE_string(image_ext, ".jpg", "Image file extension for YOLO");
DEFINE_string(output_classes, "", "Classes file written for YOLO as target (default: <output>/../classes.txt)");
DEFINE_bool(v, false, "Print version and exit");

static const char *kUsage = "Convert between computer vision annotation formats (COCO, YOLO, Pascal VOC)\n"
                            "Usage:\n"
                            "  AnnotationConverter <source> <target> -i <INPUT> -o <OUTPUT> [options]\n"
                            "  <source>, <target>: coco | yolo | voc\n"
                            "Examples:\n"
                            "  AnnotationConverter coco yolo -i annotations.json -o labels/ --classes classes.txt\n"
                            "  AnnotationConverter yolo voc -i labels/ -o voc_annotations/ --images images/ "
                            "--classes classes.txt\n"
                            "  AnnotationConverter voc coco -i voc_annotations/ -o annotations.json";

/// @brief "--image-ext" のようなハイフン区切りのフラグ名を gflags が受け付ける "--image_ext" に置き換える
static void normalizeFlagNames(int argc, char **argv, std::vector<std::string> &storage)
{
    storage.reserve(argc);
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) continue;

        const size_t nameEnd = std::min(arg.find('='), arg.size());
        bool replaced = false;
        for (size_t pos = 2; pos < nameEnd; pos++)
        {
            if (arg[pos] == '-')
            {
                arg[pos] = '_';
                replaced = true;
            }
        }
        if (replaced)
        {
            storage.push_back(arg);
            argv[i] = &storage.back()[0];
        }
    }
}

static int usageError(const std::string &message)
{
    std::cerr << "Error: " << message << "\n\n" << gflags::ProgramUsage() << std::endl;
    return 2;
}

int main(int argc, char **argv)
{
    std::vector<std::string> normalizedArgs;
    normalizeFlagNames(argc, argv, normalizedArgs);

    gflags::SetUsageMessage(kUsage);
    gflags::SetVersionString(kVersion);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_v)
    {
        std::cout << "AnnotationConverter " << kVersion << std::endl;
        return EXIT_SUCCESS;
    }

    // 残った引数が <source> <target>
    if (argc != 3)
    {
        return usageError("expected <source> and <target> formats");
    }
    const std::string sourceFormat = argv[1];
    const std::string targetFormat = argv[2];
    const std::string inputPath = FLAGS_input.empty() ? FLAGS_i : FLAGS_input;
    const std::string outputPath = FLAGS_output.empty() ? FLAGS_o : FLAGS_output;
    if (inputPath.empty() || outputPath.empty())
    {
        return usageError("-i/--input and -o/--output are required");
    }

    try
    {
        const AnnotationFormat source = Converter::ParseFormat(sourceFormat);
        const AnnotationFormat target = Converter::ParseFormat(targetFormat);
        if (source == AnnotationFormat::Yolo && (FLAGS_images.empty() || FLAGS_classes.empty()))
        {
            return usageError("YOLO source format requires --images and --classes arguments");
        }

        ConversionOptions options;
        options.imagesDir = FLAGS_images;
        options.classesFile = FLAGS_classes;
        options.imageExt = FLAGS_image_ext;
        options.outputClassesFile = FLAGS_output_classes;
        if (options.outputClassesFile.empty() && target == AnnotationFormat::Yolo && source != AnnotationFormat::Yolo)
        {
            // YOLO への変換では --classes を出力先として扱う
            options.outputClassesFile = FLAGS_classes;
        }

        std::cout << "Converting " << Converter::FormatName(source) << " -> " << Converter::FormatName(target) << "..."
                  << std::endl;
        std::cout << "Input: " << inputPath << std::endl;
        std::cout << "Output: " << outputPath << std::endl;

        Converter converter;
        ConversionSummary summary;
        converter.Convert(sourceFormat, targetFormat, inputPath, outputPath, options, summary);

        std::cout << "\nConversion completed successfully!" << std::endl;
        std::cout << "Images: " << summary.numImages << std::endl;
        std::cout << "Categories: " << summary.numCategories << std::endl;
        std::cout << "Total annotations: " << summary.numAnnotations << std::endl;
    }
    catch (const AnnotationError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    gflags::ShutDownCommandLineFlags();
    return EXIT_SUCCESS;
}
