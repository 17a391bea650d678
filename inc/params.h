#ifndef _BK_PARAMS_H
#define _BK_PARAMS_H

#include <string>
#include <vector>

#include "types.h"

// ---------------------------------------------------------------------------
// One complex Gaussian term of the disc approximation:
//   k(x) = exp(-a x^2) * (cos(b x^2) + i sin(b x^2))
// contributing real_weight * Re + imag_weight * Im to the final image.
// ---------------------------------------------------------------------------
struct kernel_component_s
{
    double a;
    double b;
    double real_weight;
    double imag_weight;
};

// A kernel family (parameter table).  Component order is kept as given.
struct kernel_params_s
{
    std::string name;
    std::vector<kernel_component_s> components;

    int num_components() const { return (int)components.size(); }

    double a(int i) const { return components[i].a; }
    double b(int i) const { return components[i].b; }
    double real_weight(int i) const { return components[i].real_weight; }
    double imag_weight(int i) const { return components[i].imag_weight; }
};

#define BK_MIN_PRESET 1
#define BK_MAX_PRESET 9

// Canonical n-component family (n in [BK_MIN_PRESET, BK_MAX_PRESET]).
// Returns nullptr for any other n.
const kernel_params_s *kernel_params_preset(int n);

// Empty table or non-finite values -> BK_ERR_CONFIG
bk_status_e validate_kernel_params(const kernel_params_s &params);

// Load a custom table from a text file:
//
//   # comment
//   name: my family
//   # a        b         real_weight   imag_weight
//     0.862325 1.624835  0.767583      1.862321
//
// Returns false on open error, malformed line, or an empty table.
bool load_kernel_params(const char *path, kernel_params_s &params);

void print_kernel_params(const kernel_params_s &params);

#endif
