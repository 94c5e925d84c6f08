/*
* @Author: BlahGeek
* @Date:   2016-06-02
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#ifndef LENSWARP_BASE_H
#define LENSWARP_BASE_H value

#include "rapidjson/document.h"
#include <cmath>
#include <exception>
#include <stdexcept>
#include <vector>
#include <string>
#include <stdint.h>
#include <iostream>

#include "opencv2/core.hpp"


namespace lenswarp {

/**
 * Invalid camera / lens / layout options, raised before any pixel is processed.
 * parameter() is the offending option key, e.g. "fov" or "output.layout".
 */
class ConfigurationError: public std::runtime_error {
protected:
    std::string param;
public:
    ConfigurationError(const std::string & param, const std::string & msg):
        std::runtime_error(msg), param(param) {}
    const std::string & parameter() const { return param; }
};

class DecodeError: public std::runtime_error {
protected:
    std::string path;
public:
    DecodeError(const std::string & path, const std::string & msg):
        std::runtime_error(msg), path(path) {}
    const std::string & filename() const { return path; }
};

class EncodeError: public DecodeError {
public:
    EncodeError(const std::string & path, const std::string & msg):
        DecodeError(path, msg) {}
};

/**
 * Rigid rotation of the sphere
 * pitch about x (lateral), then yaw about z (vertical, the panorama pole), then roll about y (depth)
 */
class CV_EXPORTS_W Rotation {
protected:
    cv::Matx33d rotate_matrix;

public:
    Rotation();
    /**
     * @param pitch, yaw, roll  in degrees
     */
    Rotation(double pitch, double yaw, double roll);

    // rotation that applies this one first, then `next`
    Rotation then(const Rotation & next) const;

    cv::Point3d apply(const cv::Point3d & xyz) const;
    cv::Point3d apply_inverse(const cv::Point3d & xyz) const;

    bool is_identity() const;
    const cv::Matx33d & get_matrix() const { return rotate_matrix; }
};

/**
 * Backward mapping from one camera (output) to another (input)
 * Built once from two camera descriptions, then applied to images
 * of the input size.
 */
class CV_EXPORTS_W RemapTemplate {
public:
    std::string out_type, in_type;
    cv::Size out_size;
    cv::Size map_size;  // out_size * supersample
    cv::Size in_size;
    int supersample = 1;

    cv::Mat map1, map2; // CV_32FC1, input pixel coordinates, -1 where missed
    cv::Mat mask;       // CV_8U, 255 where input was sampled

    bool wrap_input = false;  // input is periodic in x (equirectangular)

public:
    /**
     * @param to        Output camera type, "fisheye" or "equirectangular"
     * @param to_opts   Output camera options, "width" and "height" required
     * @param from      Input camera type
     * @param from_opts Input camera options, "width" and "height" required
     * @param rotation  Scene rotation, input is sampled at rotation^-1 * output
     * @param supersample Build maps at this multiple of the output size
     */
    RemapTemplate(const std::string & to, const rapidjson::Value & to_opts,
                  const std::string & from, const rapidjson::Value & from_opts,
                  const Rotation & rotation = Rotation(),
                  int supersample = 1);

    /**
     * Resample an input image (must match in_size) into output
     * Missed pixels are set to zero in all channels
     */
    void remap(const cv::Mat & input, cv::Mat & output) const;

    // Fraction of output pixels that sample the input
    double coverage() const;
};

/**
 * Width / height implied by a camera type and its options,
 * NAN when the width has to be given explicitly (full / cropped photos)
 */
CV_EXPORTS_W double camera_aspect_ratio(const std::string & type, const rapidjson::Value & options);

/**
 * Image file collaborator, backed by imgcodecs
 * read_image keeps depth and channels of the file (throws DecodeError)
 * write_image encodes fully in memory before touching the file,
 * and removes the file if writing fails (throws EncodeError)
 */
CV_EXPORTS_W cv::Mat read_image(const std::string & path);
CV_EXPORTS_W void write_image(const std::string & path, const cv::Mat & image);
// Output must be .jpg, .jpeg or .png, throws ConfigurationError("output")
CV_EXPORTS_W void check_output_path(const std::string & path);

class CV_EXPORTS_W Timer {
protected:
    int64_t t;
    std::string name;

public:
    explicit Timer(std::string name);
    Timer();
    double tick(std::string msg);
};

}

#endif
