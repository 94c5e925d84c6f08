/*
* @Author: BlahGeek
* @Date:   2016-06-02
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-14
*/

#if defined( _MSC_VER )
#define _USE_MATH_DEFINES
#endif
#include <cmath>
#include <algorithm>
#include <sstream>

#include "./lens.hpp"
#include "lenswarp.hpp"

using namespace lenswarp;

#define THOBY_K1 1.47
#define THOBY_K2 0.713

// tolerance for points exactly on the FoV edge
#define EDGE_EPSILON 1e-9

// Projection in focal units, from Thoby's "fisheye projections" overview
static double equidistant(double theta) { return theta; }
static double equidistant_inverse(double r) { return r; }

static double equisolid(double theta) { return 2.0 * sin(theta / 2.0); }
static double equisolid_inverse(double r) { return 2.0 * asin(std::min(r / 2.0, 1.0)); }

static double orthographic(double theta) { return sin(theta); }
static double orthographic_inverse(double r) { return asin(std::min(r, 1.0)); }

static double stereographic(double theta) { return 2.0 * tan(theta / 2.0); }
static double stereographic_inverse(double r) { return 2.0 * atan(r / 2.0); }

static double rectilinear(double theta) { return tan(theta); }
static double rectilinear_inverse(double r) { return atan(r); }

static double thoby(double theta) { return THOBY_K1 * sin(THOBY_K2 * theta); }
static double thoby_inverse(double r) { return asin(std::min(r / THOBY_K1, 1.0)) / THOBY_K2; }

Lens::Lens(LensType type, double fov):
type(type), fov(fov), project(nullptr), unproject(nullptr) {
    if(std::isnan(fov) || fov <= 0)
        throw ConfigurationError("fov", "field of view must be positive");
    if(fov > 360)
        throw ConfigurationError("fov", "field of view can not exceed 360 degrees");

    this->half_fov = fov / 360.0 * M_PI;

    // the largest FoV each projection stays monotonic (and finite) for
    double max_fov = 360;
    bool max_inclusive = true;

    switch(type) {
        case LensType::equidistant:
            project = equidistant; unproject = equidistant_inverse;
            break;
        case LensType::equisolid:
            project = equisolid; unproject = equisolid_inverse;
            break;
        case LensType::orthographic:
            project = orthographic; unproject = orthographic_inverse;
            max_fov = 180;
            break;
        case LensType::stereographic:
            project = stereographic; unproject = stereographic_inverse;
            max_inclusive = false;
            break;
        case LensType::rectilinear:
            project = rectilinear; unproject = rectilinear_inverse;
            max_fov = 180;
            max_inclusive = false;
            break;
        case LensType::thoby:
            project = thoby; unproject = thoby_inverse;
            max_fov = 360.0 / THOBY_K2 / 2.0;
            break;
    }

    if(fov > max_fov || (!max_inclusive && fov >= max_fov)) {
        std::ostringstream msg;
        msg << "a " << type_name(type) << " lens requires a field of view "
            << (max_inclusive ? "<= " : "< ") << max_fov << " degrees, got " << fov;
        throw ConfigurationError("fov", msg.str());
    }

    this->max_projection = project(this->half_fov);
}

double Lens::angle_to_radius(double angle) const {
    if(std::isnan(angle) || angle < 0 || angle > this->half_fov + EDGE_EPSILON)
        return NAN;
    angle = std::min(angle, this->half_fov);
    return project(angle) / this->max_projection;
}

double Lens::radius_to_angle(double radius) const {
    if(std::isnan(radius) || radius < 0 || radius > 1.0 + EDGE_EPSILON)
        return NAN;
    radius = std::min(radius, 1.0);
    return std::min(unproject(radius * this->max_projection), this->half_fov);
}

LensType Lens::parse_type(const std::string & name) {
    #define X(s) \
        else if(name == #s) return LensType::s;

    if(false){}
    X(equidistant)
    X(equisolid)
    X(orthographic)
    X(stereographic)
    X(rectilinear)
    X(thoby)

    #undef X

    throw ConfigurationError("lens", "unknown lens type \"" + name + "\"");
}

const char * Lens::type_name(LensType type) {
    switch(type) {
        case LensType::equidistant: return "equidistant";
        case LensType::equisolid: return "equisolid";
        case LensType::orthographic: return "orthographic";
        case LensType::stereographic: return "stereographic";
        case LensType::rectilinear: return "rectilinear";
        case LensType::thoby: return "thoby";
    }
    return "unknown";
}
