/**
 * @file filter_tool.cpp
 * @brief Example: run a filter chain on an image file
 *
 * Usage:
 *   pixkit_filter_tool <input> <output> <chain> [--format jpeg|png] [--quality N] [--verbose]
 *
 * Chain example:
 *   "grayscale | blur:sigma=2 | resize:width=640 | vignette:intensity=0.7"
 */

#include <PixKit/PixKit.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace Pix::Kit;

namespace {

void PrintUsage(const char* argv0) {
    printf("Usage: %s <input> <output> <chain> [--format jpeg|png] [--quality N] [--verbose]\n\n", argv0);
    printf("Stages (separated by '|', parameters as key=value after ':'):\n");
    printf("  grayscale  sepia  invert\n");
    printf("  blur:sigma=5            brightness:factor=0.2\n");
    printf("  contrast:factor=1.5     saturation:factor=0.5\n");
    printf("  vignette:intensity=0.5,radius=0.5\n");
    printf("  watercolor:radius=5     oil_painting:radius=4,levels=20\n");
    printf("  resize:width=W,height=H rotate:angle=90\n");
    printf("  crop:x=0,y=0,width=W,height=H\n");
    printf("  flip:mode=horizontal|vertical|both\n");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        PrintUsage(argv[0]);
        return 1;
    }

    const std::string inputPath = argv[1];
    const std::string outputPath = argv[2];
    const std::string chain = argv[3];

    Pipeline::EncodeOptions encode;
    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
            try {
                encode.format = IO::ParseImageFormat(argv[++i]);
            } catch (const InvalidArgumentException& e) {
                fprintf(stderr, "Error: %s\n", e.what());
                return 1;
            }
        } else if (std::strcmp(argv[i], "--quality") == 0 && i + 1 < argc) {
            encode.jpegQuality = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Platform::SetLogLevel(Platform::LogLevel::Debug);
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            PrintUsage(argv[0]);
            return 1;
        }
    }

    printf("=== PixKit %s: Filter Tool ===\n\n", GetVersion());

    try {
        // 1. Parse the chain
        Pipeline::FilterPipeline pipeline = Pipeline::ParseFilterChain(chain);
        printf("1. Chain with %zu stage(s):", pipeline.Size());
        for (const auto& stage : pipeline.Stages()) {
            printf(" %s", Pipeline::GetStageName(stage.Kind()));
        }
        printf("\n");

        // 2. Read input
        EncodedImage input = IO::ReadFileBytes(inputPath);
        printf("2. Read %zu bytes from '%s'\n", input.size(), inputPath.c_str());

        // 3. Run
        EncodedImage output = pipeline.Run(input, encode);
        printf("3. Encoded %s\n", output == input ? "nothing" : "result");
        if (output == input) {
            printf("   Warning: output equals input (undecodable or unencodable image)\n");
        }

        // 4. Write result
        IO::WriteFileBytes(outputPath, output);
        printf("4. Wrote %zu bytes to '%s'\n", output.size(), outputPath.c_str());
    } catch (const Exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 2;
    }

    printf("\n=== Done ===\n");
    return 0;
}
