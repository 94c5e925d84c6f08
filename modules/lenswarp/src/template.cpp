/*
* @Author: BlahGeek
* @Date:   2016-06-06
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#include "lenswarp.hpp"
#include "./camera.hpp"
#include <iostream>
#include <sstream>
#include <stdio.h>
#include <climits>
#include "opencv2/imgproc.hpp"
#include "parallel_caller.hpp"


using namespace lenswarp;

// Tag configuration errors with the camera they come from
static std::unique_ptr<Camera> new_camera(const char * role,
                                          const std::string & type,
                                          const rapidjson::Value & options) {
    try {
        return Camera::New(type, options);
    } catch(ConfigurationError & e) {
        throw ConfigurationError(std::string(role) + "." + e.parameter(), e.what());
    }
}

RemapTemplate::RemapTemplate(const std::string & to, const rapidjson::Value & to_opts,
                             const std::string & from, const rapidjson::Value & from_opts,
                             const Rotation & rotation, int supersample):
out_type(to), in_type(from), supersample(supersample) {

    if(supersample < 1)
        throw ConfigurationError("supersample", "supersample factor must be at least 1");

    std::unique_ptr<Camera> in_cam = new_camera("input", from, from_opts);
    std::unique_ptr<Camera> out_cam = new_camera("output", to, to_opts);
    this->in_size = in_cam->get_size();
    this->out_size = out_cam->get_size();

    if(supersample > 1) {
        if(out_size.width > INT_MAX / supersample || out_size.height > INT_MAX / supersample)
            throw ConfigurationError("supersample", "supersample factor too large for the output size");
        rapidjson::Document map_opts;
        map_opts.CopyFrom(to_opts, map_opts.GetAllocator());
        map_opts["width"].SetInt(out_size.width * supersample);
        map_opts["height"].SetInt(out_size.height * supersample);
        out_cam = new_camera("output", to, map_opts);
    }
    this->map_size = out_cam->get_size();
    this->wrap_input = in_cam->is_periodic();

    std::cerr << "Output type: " << to << ", Size: " << out_size
              << " (maps " << map_size << ")" << std::endl
              << "Input type: " << from << ", Size: " << in_size << std::endl;

    Timer timer("RemapTemplate");

    const Camera & out_camera = *out_cam;
    const Camera & in_camera = *in_cam;
    bool rotate = !rotation.is_identity();

    this->map1.create(map_size, CV_32FC1);
    this->map2.create(map_size, CV_32FC1);
    this->mask.create(map_size, CV_8U);

    auto process_row_block = [&](const cv::Range & row_range)
    {
        for(int h = row_range.start ; h < row_range.end ; h += 1) {
            unsigned char * mask_row = mask.ptr(h);
            float * map1_row = map1.ptr<float>(h);
            float * map2_row = map2.ptr<float>(h);

            for(int w = 0 ; w < map_size.width ; w += 1) {
                cv::Point2d p(NAN, NAN);
                cv::Point3d xyz = out_camera.image_to_obj_single(cv::Point2d(w, h));
                if(!is_miss(xyz)) {
                    // rotation moves the scene, so look it up backwards
                    if(rotate)
                        xyz = rotation.apply_inverse(xyz);
                    p = in_camera.obj_to_image_single(xyz);
                }

                if(is_miss(p)) {
                    mask_row[w] = 0;
                    map1_row[w] = map2_row[w] = -1.0f;
                }
                else {
                    mask_row[w] = 255;
                    map1_row[w] = float(p.x);
                    map2_row[w] = float(p.y);
                }
            }
        }
    };
    parallel_for_caller(cv::Range(0, map_size.height), process_row_block);

    timer.tick("Building maps");
    fprintf(stderr, "Coverage: %.1f%%\n", this->coverage() * 100.0);
}

double RemapTemplate::coverage() const {
    if(mask.empty())
        return 0;
    return double(cv::countNonZero(mask)) / double(mask.total());
}

void RemapTemplate::remap(const cv::Mat & input, cv::Mat & output) const {
    if(input.size() != this->in_size) {
        std::ostringstream msg;
        msg << "input image is " << input.size() << " but the template expects " << in_size;
        throw ConfigurationError("input.size", msg.str());
    }

    Timer timer("remap");

    // one pixel of border on each side: bilinear samples near the edge
    // clamp to the edge pixel, or wrap around for periodic inputs
    cv::Mat padded_x, padded;
    cv::copyMakeBorder(input, padded_x, 0, 0, 1, 1,
                       wrap_input ? cv::BORDER_WRAP : cv::BORDER_REPLICATE);
    cv::copyMakeBorder(padded_x, padded, 1, 1, 0, 0, cv::BORDER_REPLICATE);

    cv::Mat remapped;
    cv::remap(padded, remapped, map1 + 1.0, map2 + 1.0,
              cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    remapped.setTo(cv::Scalar::all(0), mask == 0);
    timer.tick("remap");

    if(supersample > 1) {
        cv::resize(remapped, output, out_size, 0, 0, cv::INTER_AREA);
        timer.tick("Downsampling");
    }
    else
        output = remapped;
}
