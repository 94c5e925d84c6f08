/*
* @Author: BlahGeek
* @Date:   2016-06-14
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#include <iostream>
#include <fstream>
#include <algorithm>
#include <sstream>
#include <cmath>
#include <cstdlib>
#include <stdio.h>
#if defined(__linux__) || defined(__APPLE__)
#include <unistd.h>
#include <getopt.h>
#elif defined(_WIN32)
#include "getopt.h"
#endif
#include "opencv2/core.hpp"

#include "rapidjson/document.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/error/en.h"

#include "./commands.hpp"

using namespace lenswarp;

enum {
    OPT_TYPE = 256,
    OPT_LENS,
    OPT_FOV,
    OPT_ITYPE,
    OPT_OTYPE,
    OPT_ILENS,
    OPT_OLENS,
    OPT_IFOV,
    OPT_OFOV,
    OPT_SSAMPLE,
};

static const struct option long_options[] = {
    {"type", required_argument, NULL, OPT_TYPE},
    {"lens", required_argument, NULL, OPT_LENS},
    {"fov", required_argument, NULL, OPT_FOV},
    {"itype", required_argument, NULL, OPT_ITYPE},
    {"otype", required_argument, NULL, OPT_OTYPE},
    {"ilens", required_argument, NULL, OPT_ILENS},
    {"olens", required_argument, NULL, OPT_OLENS},
    {"ifov", required_argument, NULL, OPT_IFOV},
    {"ofov", required_argument, NULL, OPT_OFOV},
    {"ssample", required_argument, NULL, OPT_SSAMPLE},
    {"size", required_argument, NULL, 's'},
    {"rotation", required_argument, NULL, 'r'},
    {"help", no_argument, NULL, 'h'},
    {NULL, 0, NULL, 0}
};

static double parse_double(const std::string & text, const std::string & flag) {
    const char * begin = text.c_str();
    char * end = NULL;
    double ret = strtod(begin, &end);
    if(end == begin || *end != '\0' || std::isnan(ret) || std::isinf(ret))
        throw ConfigurationError(flag, "\"" + text + "\" is not a number");
    return ret;
}

static int parse_positive_int(const std::string & text, const std::string & flag) {
    const char * begin = text.c_str();
    char * end = NULL;
    long ret = strtol(begin, &end, 10);
    if(end == begin || *end != '\0')
        throw ConfigurationError(flag, "\"" + text + "\" is not an integer");
    if(ret <= 0 || ret > 1000000)
        throw ConfigurationError(flag, "\"" + text + "\" is out of range");
    return int(ret);
}

// "P,Y,R"
static Rotation parse_rotation(const std::string & text) {
    std::vector<double> angles;
    std::istringstream ss(text);
    std::string item;
    while(std::getline(ss, item, ','))
        angles.push_back(parse_double(item, "--rotation"));
    if(angles.size() != 3)
        throw ConfigurationError("--rotation", "expects three numbers: pitch yaw roll, got \"" + text + "\"");
    return Rotation(angles[0], angles[1], angles[2]);
}

static std::vector<std::string> allowed_flags(const std::string & command) {
    if(command == "make-photo" || command == "make-pano")
        return {"type", "lens", "fov", "size", "ssample"};
    if(command == "alter-photo")
        return {"itype", "otype", "ilens", "olens", "ifov", "ofov", "size", "ssample"};
    return {};
}

bool lenswarp::parse_arguments(int argc, char * argv[], Arguments & args) {
    args.command = argv[0];
#if defined(__APPLE__)
    optreset = 1;
    optind = 1;
#else
    optind = 0;
#endif

    // "--rotation P Y R" takes three words, getopt only knows one:
    // join them as "--rotation=P,Y,R" (which also keeps negative angles away from getopt)
    std::vector<std::string> words;
    for(int i = 0 ; i < argc ; i += 1) {
        std::string word = argv[i];
        if((word == "-r" || word == "--rotation") && i + 3 < argc &&
           std::string(argv[i + 1]).find(',') == std::string::npos) {
            words.push_back(std::string("--rotation=") + argv[i + 1] + "," + argv[i + 2] + "," + argv[i + 3]);
            i += 3;
        }
        else
            words.push_back(word);
    }
    std::vector<char *> word_ptrs;
    for(auto & w: words)
        word_ptrs.push_back(&w[0]);
    word_ptrs.push_back(NULL);

    int word_count = int(words.size());
    int opt_ret, opt_index = 0;
    while((opt_ret = getopt_long(word_count, word_ptrs.data(), "r:s:h", long_options, &opt_index)) != -1) {
        switch(opt_ret) {
            case 'r': args.rotations.push_back(parse_rotation(optarg)); break;
            case 's': args.values["size"] = optarg; break;
            case 'h': return false;
            case '?': return false;
            default:
                args.values[long_options[opt_index].name] = optarg;
        }
    }
    for(int i = optind ; i < word_count ; i += 1)
        args.positional.push_back(word_ptrs[i]);

    auto allowed = allowed_flags(args.command);
    for(auto & kv: args.values) {
        if(std::find(allowed.begin(), allowed.end(), kv.first) == allowed.end())
            throw ConfigurationError("--" + kv.first, "not an option of " + args.command);
    }
    if(args.command == "remap" && !args.rotations.empty())
        throw ConfigurationError("--rotation", "not an option of remap, use \"rotation\" in the job file");
    return true;
}

static const std::string & require(const Arguments & args, const char * name) {
    auto it = args.values.find(name);
    if(it == args.values.end())
        throw ConfigurationError(std::string("--") + name, "missing required option");
    return it->second;
}

static int optional_int(const Arguments & args, const char * name, int default_value) {
    auto it = args.values.find(name);
    if(it == args.values.end())
        return default_value;
    return parse_positive_int(it->second, std::string("--") + name);
}

static Rotation chain(const std::vector<Rotation> & rotations) {
    Rotation ret;
    for(auto & r: rotations)
        ret = ret.then(r);
    return ret;
}

static void panorama_options(rapidjson::Document & doc, cv::Size size) {
    doc.SetObject();
    auto & alloc = doc.GetAllocator();
    doc.AddMember("width", size.width, alloc);
    doc.AddMember("height", size.height, alloc);
}

static void fisheye_options(rapidjson::Document & doc, const std::string & layout,
                            const std::string & lens, double fov, cv::Size size) {
    doc.SetObject();
    auto & alloc = doc.GetAllocator();
    rapidjson::Value layout_value(layout.c_str(), alloc);
    rapidjson::Value lens_value(lens.c_str(), alloc);
    doc.AddMember("width", size.width, alloc);
    doc.AddMember("height", size.height, alloc);
    doc.AddMember("layout", layout_value, alloc);
    doc.AddMember("lens", lens_value, alloc);
    doc.AddMember("fov", fov, alloc);
}

cv::Size lenswarp::photo_size(const std::string & layout, int height, double fallback_aspect) {
    rapidjson::Document opts;
    opts.SetObject();
    rapidjson::Value layout_value(layout.c_str(), opts.GetAllocator());
    opts.AddMember("layout", layout_value, opts.GetAllocator());

    double aspect = NAN;
    try {
        aspect = camera_aspect_ratio("fisheye", opts);
    } catch(ConfigurationError & e) {
        throw ConfigurationError("output." + e.parameter(), e.what());
    }
    if(std::isnan(aspect))
        aspect = fallback_aspect;
    int width = std::max(2, int(std::lround(height * aspect)));
    if(layout == "double" && width % 2 != 0)
        width += 1;
    return cv::Size(width, height);
}

static int remap_and_write(const std::string & to, const rapidjson::Value & to_opts,
                           const std::string & from, const rapidjson::Value & from_opts,
                           const Rotation & rotation, int supersample,
                           const cv::Mat & input, const std::string & output) {
    RemapTemplate remap_template(to, to_opts, from, from_opts, rotation, supersample);

    cv::Mat result;
    remap_template.remap(input, result);

    fprintf(stderr, "Writing %s (%dx%d)...\n", output.c_str(), result.cols, result.rows);
    write_image(output, result);
    return 0;
}

std::string lenswarp::display_name(const ErrorNames & names, const std::string & key) {
    auto it = names.find(key);
    if(it == names.end())
        return key;
    return it->second;
}

// Rename option keys of ConfigurationError to what the user typed
template <typename F>
static int translate_errors(const ErrorNames & names, F func) {
    try {
        return func();
    } catch(ConfigurationError & e) {
        throw ConfigurationError(display_name(names, e.parameter()), e.what());
    }
}

static cv::Mat read_input(const std::string & path) {
    fprintf(stderr, "Reading %s...\n", path.c_str());
    return read_image(path);
}

int lenswarp::make_photo(const Arguments & args) {
    const std::string & input = args.positional[0];
    const std::string & output = args.positional[1];
    ErrorNames names = {
        {"output.layout", "--type"}, {"output.lens", "--lens"}, {"output.fov", "--fov"},
        {"output.width", "--size"}, {"output.height", "--size"},
        {"input.width", input}, {"input.height", input},
        {"supersample", "--ssample"}, {"output", output},
    };
    return translate_errors(names, [&]() -> int {
        check_output_path(output);
        std::string layout = require(args, "type");
        std::string lens = require(args, "lens");
        double fov = parse_double(require(args, "fov"), "--fov");
        int size = optional_int(args, "size", 0);
        int supersample = optional_int(args, "ssample", 1);

        cv::Mat pano = read_input(input);
        rapidjson::Document in_opts, out_opts;
        panorama_options(in_opts, pano.size());
        fisheye_options(out_opts, layout, lens, fov,
                        photo_size(layout, size > 0 ? size : pano.rows, 1.0));

        return remap_and_write("fisheye", out_opts, "equirectangular", in_opts,
                               chain(args.rotations), supersample, pano, output);
    });
}

int lenswarp::make_pano(const Arguments & args) {
    const std::string & input = args.positional[0];
    const std::string & output = args.positional[1];
    ErrorNames names = {
        {"input.layout", "--type"}, {"input.lens", "--lens"}, {"input.fov", "--fov"},
        {"input.width", input}, {"input.height", input},
        {"output.width", "--size"}, {"output.height", "--size"},
        {"supersample", "--ssample"}, {"output", output},
    };
    return translate_errors(names, [&]() -> int {
        check_output_path(output);
        std::string layout = require(args, "type");
        std::string lens = require(args, "lens");
        double fov = parse_double(require(args, "fov"), "--fov");
        int size = optional_int(args, "size", 0);
        int supersample = optional_int(args, "ssample", 1);

        cv::Mat photo = read_input(input);
        int height = size > 0 ? size : photo.rows;
        rapidjson::Document in_opts, out_opts;
        fisheye_options(in_opts, layout, lens, fov, photo.size());
        panorama_options(out_opts, cv::Size(height * 2, height));

        return remap_and_write("equirectangular", out_opts, "fisheye", in_opts,
                               chain(args.rotations), supersample, photo, output);
    });
}

int lenswarp::alter_photo(const Arguments & args) {
    const std::string & input = args.positional[0];
    const std::string & output = args.positional[1];
    ErrorNames names = {
        {"input.layout", "--itype"}, {"input.lens", "--ilens"}, {"input.fov", "--ifov"},
        {"input.width", input}, {"input.height", input},
        {"output.layout", "--otype"}, {"output.lens", "--olens"}, {"output.fov", "--ofov"},
        {"output.width", "--size"}, {"output.height", "--size"},
        {"supersample", "--ssample"}, {"output", output},
    };
    return translate_errors(names, [&]() -> int {
        check_output_path(output);
        std::string in_layout = require(args, "itype");
        std::string out_layout = require(args, "otype");
        std::string in_lens = require(args, "ilens");
        std::string out_lens = require(args, "olens");
        double in_fov = parse_double(require(args, "ifov"), "--ifov");
        double out_fov = parse_double(require(args, "ofov"), "--ofov");
        int size = optional_int(args, "size", 0);
        int supersample = optional_int(args, "ssample", 1);

        cv::Mat photo = read_input(input);
        // full / cropped outputs keep the shape of one input circle
        double circle_width = in_layout == "double" ? photo.cols / 2.0 : photo.cols;
        double circle_aspect = circle_width / photo.rows;

        rapidjson::Document in_opts, out_opts;
        fisheye_options(in_opts, in_layout, in_lens, in_fov, photo.size());
        fisheye_options(out_opts, out_layout, out_lens, out_fov,
                        photo_size(out_layout, size > 0 ? size : photo.rows, circle_aspect));

        return remap_and_write("fisheye", out_opts, "fisheye", in_opts,
                               chain(args.rotations), supersample, photo, output);
    });
}

static const rapidjson::Value & job_camera(const rapidjson::Document & job, const char * role) {
    if(!job.HasMember(role) || !job[role].IsObject())
        throw ConfigurationError(role, "missing camera description");
    const rapidjson::Value & cam = job[role];
    if(!cam.HasMember("type") || !cam["type"].IsString())
        throw ConfigurationError(std::string(role) + ".type", "missing camera type");
    if(cam.HasMember("options") && !cam["options"].IsObject())
        throw ConfigurationError(std::string(role) + ".options", "camera options must be a JSON object");
    return cam;
}

static void copy_options(rapidjson::Document & doc, const rapidjson::Value & cam) {
    if(cam.HasMember("options"))
        doc.CopyFrom(cam["options"], doc.GetAllocator());
    else
        doc.SetObject();
}

static void set_int_member(rapidjson::Document & doc, const char * key, int value) {
    if(doc.HasMember(key))
        doc[key].SetInt(value);
    else
        doc.AddMember(rapidjson::StringRef(key), value, doc.GetAllocator());
}

static Rotation job_rotation(const rapidjson::Document & job) {
    Rotation ret;
    if(!job.HasMember("rotation"))
        return ret;

    auto triple = [](const rapidjson::Value & v) -> Rotation {
        if(!v.IsArray() || v.Size() != 3 || !v[0].IsNumber() || !v[1].IsNumber() || !v[2].IsNumber())
            throw ConfigurationError("rotation", "expects [pitch, yaw, roll] or a list of them");
        return Rotation(v[0].GetDouble(), v[1].GetDouble(), v[2].GetDouble());
    };

    const rapidjson::Value & rotation = job["rotation"];
    if(rotation.IsArray() && rotation.Size() > 0 && rotation[0].IsNumber())
        return triple(rotation);
    if(!rotation.IsArray())
        throw ConfigurationError("rotation", "expects [pitch, yaw, roll] or a list of them");
    for(auto i = rotation.Begin() ; i != rotation.End() ; i ++)
        ret = ret.then(triple(*i));
    return ret;
}

int lenswarp::remap_job(const Arguments & args) {
    const std::string & config = args.positional[0];
    const std::string & input = args.positional[1];
    const std::string & output = args.positional[2];

    try {
        check_output_path(output);
    } catch(ConfigurationError & e) {
        throw ConfigurationError(output, e.what());
    }

    std::ifstream f(config);
    if(!f)
        throw DecodeError(config, "can not open job file");
    rapidjson::Document job;
    rapidjson::IStreamWrapper isw(f);
    job.ParseStream(isw);
    if(job.HasParseError()) {
        std::ostringstream msg;
        msg << rapidjson::GetParseError_En(job.GetParseError()) << " (at offset " << job.GetErrorOffset() << ")";
        throw ConfigurationError(config, msg.str());
    }

    try {
        if(!job.IsObject())
            throw ConfigurationError("job", "job must be a JSON object");

        const rapidjson::Value & in_cam = job_camera(job, "input");
        const rapidjson::Value & out_cam = job_camera(job, "output");
        std::string in_type = in_cam["type"].GetString();
        std::string out_type = out_cam["type"].GetString();

        int supersample = 1;
        if(job.HasMember("supersample")) {
            if(!job["supersample"].IsInt())
                throw ConfigurationError("supersample", "must be an integer");
            supersample = job["supersample"].GetInt();
        }
        Rotation rotation = job_rotation(job);

        rapidjson::Document out_opts;
        copy_options(out_opts, out_cam);
        if(!out_opts.HasMember("height"))
            throw ConfigurationError("output.options.height", "output height is required");
        if(!out_opts.HasMember("width")) {
            double aspect = NAN;
            try {
                aspect = camera_aspect_ratio(out_type, out_opts);
            } catch(ConfigurationError & e) {
                throw ConfigurationError("output." + e.parameter(), e.what());
            }
            if(std::isnan(aspect))
                throw ConfigurationError("output.options.width", "output width is required for this layout");
            if(!out_opts["height"].IsInt())
                throw ConfigurationError("output.options.height", "must be an integer");
            set_int_member(out_opts, "width", std::max(2, int(std::lround(out_opts["height"].GetInt() * aspect))));
        }

        cv::Mat img = read_input(input);
        rapidjson::Document in_opts;
        copy_options(in_opts, in_cam);
        set_int_member(in_opts, "width", img.cols);
        set_int_member(in_opts, "height", img.rows);

        try {
            return remap_and_write(out_type, out_opts, in_type, in_opts,
                                   rotation, supersample, img, output);
        } catch(ConfigurationError & e) {
            // camera keys live under "options" in the job file
            std::string param = e.parameter();
            for(const char * role: {"input.", "output."}) {
                std::string prefix(role);
                if(param.compare(0, prefix.size(), prefix) == 0 && param != prefix + "type")
                    param = prefix + "options." + param.substr(prefix.size());
            }
            throw ConfigurationError(param, e.what());
        }
    } catch(ConfigurationError & e) {
        throw ConfigurationError(config + ": " + e.parameter(), e.what());
    }
}
