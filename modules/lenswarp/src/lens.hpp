/*
* @Author: BlahGeek
* @Date:   2016-06-02
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-14
*/

#ifndef LENSWARP_LENS_H_
#define LENSWARP_LENS_H_ value

#include <string>

namespace lenswarp {

enum class LensType {
    equidistant,
    equisolid,
    orthographic,
    stereographic,
    rectilinear,
    thoby,
};

/**
 * Ideal radially symmetric lens
 * Maps incidence angle (radians, from optical axis) to a radius
 * normalized so that half of the FoV lands on radius 1.
 */
class Lens {
private:
    typedef double (*LensFunction)(double);

    LensType type;
    double fov;       // degrees
    double half_fov;  // radians
    double max_projection;

    // projection in focal units, and its inverse
    LensFunction project;
    LensFunction unproject;

public:
    Lens(LensType type, double fov);

    /**
     * @param  angle incidence angle in radians
     * @return       radius in [0, 1], NAN if beyond half of the FoV
     */
    double angle_to_radius(double angle) const;

    /**
     * @param  radius normalized radius
     * @return        incidence angle in [0, PI], NAN if radius > 1
     */
    double radius_to_angle(double radius) const;

    LensType get_type() const { return type; }
    double get_fov() const { return fov; }
    double get_half_fov() const { return half_fov; }

public:
    // throws ConfigurationError("lens")
    static LensType parse_type(const std::string & name);
    static const char * type_name(LensType type);
};

}

#endif
