/*
* @Author: BlahGeek
* @Date:   2016-06-02
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-18
*/

#include "./camera.hpp"
#include <iostream>
#include <opencv2/core.hpp>
#include "./cameras/equirectangular.hpp"
#include "./cameras/fisheye_cam.hpp"
#include "./layout.hpp"

using namespace lenswarp;

std::unique_ptr<Camera> Camera::New(const std::string & type, const rapidjson::Value & options) {
    if(!options.IsObject())
        throw ConfigurationError("options", "camera options must be a JSON object");

    #define X(s, t) \
        else if (type == s) return std::unique_ptr<Camera>(new t(options));

    if(false){}

    X("fisheye", FisheyeCamera)
    X("equirectangular", Equirectangular)

    #undef X

    throw ConfigurationError("type", "unknown camera type \"" + type + "\"");
}

double lenswarp::camera_aspect_ratio(const std::string & type, const rapidjson::Value & options) {
    if(type == "equirectangular")
        return 2.0;
    if(type == "fisheye") {
        auto layout = Layout::parse_type(get_string_option(options, "layout", "inscribed"));
        if(layout == LayoutType::inscribed)
            return 1.0;
        if(layout == LayoutType::double_inscribed)
            return 2.0;
        return NAN;
    }
    throw ConfigurationError("type", "unknown camera type \"" + type + "\"");
}

Camera::Camera(const rapidjson::Value & options) {
    this->size.width = get_int_option(options, "width");
    this->size.height = get_int_option(options, "height");
    if(this->size.width <= 0)
        throw ConfigurationError("width", "image width must be positive");
    if(this->size.height <= 0)
        throw ConfigurationError("height", "image height must be positive");
}

int lenswarp::get_int_option(const rapidjson::Value & options, const char * key) {
    if(!options.HasMember(key))
        throw ConfigurationError(key, std::string("missing option \"") + key + "\"");
    if(!options[key].IsInt())
        throw ConfigurationError(key, std::string("option \"") + key + "\" must be an integer");
    return options[key].GetInt();
}

double lenswarp::get_double_option(const rapidjson::Value & options, const char * key) {
    if(!options.HasMember(key))
        throw ConfigurationError(key, std::string("missing option \"") + key + "\"");
    if(!options[key].IsNumber())
        throw ConfigurationError(key, std::string("option \"") + key + "\" must be a number");
    return options[key].GetDouble();
}

std::string lenswarp::get_string_option(const rapidjson::Value & options, const char * key) {
    if(!options.HasMember(key))
        throw ConfigurationError(key, std::string("missing option \"") + key + "\"");
    if(!options[key].IsString())
        throw ConfigurationError(key, std::string("option \"") + key + "\" must be a string");
    return options[key].GetString();
}

std::string lenswarp::get_string_option(const rapidjson::Value & options, const char * key,
                                        const std::string & default_value) {
    if(!options.HasMember(key))
        return default_value;
    return get_string_option(options, key);
}
