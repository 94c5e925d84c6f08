/*
* @Author: BlahGeek
* @Date:   2016-06-14
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#ifndef LENSWARP_APP_COMMANDS_H
#define LENSWARP_APP_COMMANDS_H value

#include <map>
#include <string>
#include <vector>
#include "lenswarp.hpp"

namespace lenswarp {

/**
 * Parsed command line of one command
 * values: long flag name (without dashes) -> raw text
 * rotations: every --rotation in order, already parsed
 */
struct Arguments {
    std::string command;
    std::map<std::string, std::string> values;
    std::vector<Rotation> rotations;
    std::vector<std::string> positional;
};

/**
 * Parse argv of a command (argv[0] is the command name)
 * @return false on a usage error, already reported by getopt
 * Throws ConfigurationError for malformed values
 */
bool parse_arguments(int argc, char * argv[], Arguments & args);

/**
 * Option key of a ConfigurationError -> flag or file name the user typed
 * e.g. "output.fov" -> "--fov"
 */
typedef std::map<std::string, std::string> ErrorNames;

// The key itself when it has no name
std::string display_name(const ErrorNames & names, const std::string & key);

/**
 * Size of an output photo of given layout and height
 * inscribed: square, double: two squares side by side
 * full / cropped photos take fallback_aspect
 */
cv::Size photo_size(const std::string & layout, int height, double fallback_aspect);

int make_photo(const Arguments & args);
int make_pano(const Arguments & args);
int alter_photo(const Arguments & args);
int remap_job(const Arguments & args);

}

#endif
