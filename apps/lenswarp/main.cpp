/*
* @Author: BlahGeek
* @Date:   2016-06-14
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#include <iostream>
#include <stdio.h>
#include "opencv2/core.hpp"
#include "lenswarp.hpp"
#include "./commands.hpp"

using namespace lenswarp;

static const char * usage =
    "Usage: %s COMMAND [OPTIONS] INPUT OUTPUT\n"
    "Commands:\n"
    "    make-photo    Make a photo out of an equirectangular panorama\n"
    "    make-pano     Make an equirectangular panorama out of a photo\n"
    "    alter-photo   Change layout, lens, FoV and orientation of a photo\n"
    "    remap         Run a JSON job: remap CONFIG.json INPUT OUTPUT\n"
    "Options of make-photo, make-pano:\n"
    "    --type T      Photo layout: inscribed, full, cropped or double\n"
    "    --lens L      equidistant, equisolid, orthographic, stereographic,\n"
    "                  rectilinear or thoby\n"
    "    --fov F       Field of view in degrees (of each circle for double)\n"
    "Options of alter-photo:\n"
    "    --itype T, --otype T, --ilens L, --olens L, --ifov F, --ofov F\n"
    "Common options:\n"
    "    -r, --rotation P Y R   Rotate the scene by pitch, yaw, roll degrees,\n"
    "                           may be repeated\n"
    "    -s, --size H           Output height, default to input height\n"
    "    --ssample S            Supersample factor, default to 1\n"
    "Output file must be .jpg, .jpeg or .png\n"
    "";

int main(int argc, char * argv[]) {
    if(argc < 2) {
        fprintf(stderr, usage, argv[0]);
        return 1;
    }
    std::string command = argv[1];
    if(command == "-h" || command == "--help") {
        fprintf(stdout, usage, argv[0]);
        return 0;
    }

    #define COMMANDS \
        X("make-photo", make_photo, 2) \
        X("make-pano", make_pano, 2) \
        X("alter-photo", alter_photo, 2) \
        X("remap", remap_job, 3)

    try {
        Arguments args;
        if(!parse_arguments(argc - 1, argv + 1, args)) {
            fprintf(stderr, usage, argv[0]);
            return 1;
        }

        #define X(s, f, n) \
            if(command == s) { \
                if(args.positional.size() != n) { \
                    fprintf(stderr, usage, argv[0]); \
                    return 1; \
                } \
                return f(args); \
            }
        COMMANDS
        #undef X

        fprintf(stderr, "Unknown command %s\n", command.c_str());
        fprintf(stderr, usage, argv[0]);
        return 1;

    } catch(ConfigurationError & e) {
        fprintf(stderr, "Error: invalid %s: %s\n", e.parameter().c_str(), e.what());
    } catch(EncodeError & e) {
        fprintf(stderr, "Error: can not write %s: %s\n", e.filename().c_str(), e.what());
    } catch(DecodeError & e) {
        fprintf(stderr, "Error: can not read %s: %s\n", e.filename().c_str(), e.what());
    } catch(cv::Exception & e) {
        fprintf(stderr, "Error: %s\n", e.what());
    }
    #undef COMMANDS

    return 1;
}
