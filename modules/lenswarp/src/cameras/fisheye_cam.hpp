/*
* @Author: BlahGeek
* @Date:   2016-06-05
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-18
*/

#ifndef LENSWARP_FISHEYE_H
#define LENSWARP_FISHEYE_H value

#include "../camera.hpp"
#include "../lens.hpp"
#include "../layout.hpp"

namespace lenswarp {

/**
 * Photo taken by an ideal lens
 * Options: width, height, lens, fov (degrees), layout (default "inscribed")
 *
 * Circle 0 looks along +z. Circle 1 (double layout only) looks along -z
 * and is mirrored in x, so both circles share the horizon at their
 * touching edges. FoV is per circle.
 */
class FisheyeCamera: public Camera {
protected:
    Lens lens;
    Layout layout;

public:
    FisheyeCamera(const rapidjson::Value & options);

    const Lens & get_lens() const { return lens; }
    const Layout & get_layout() const { return layout; }

    cv::Point3d image_to_obj_single(const cv::Point2d & xy) const override;
    cv::Point2d obj_to_image_single(const cv::Point3d & xyz) const override;
};

}

#endif
