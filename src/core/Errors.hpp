// ========================= src/core/Errors.hpp =========================
#pragma once
#include <stdexcept>
#include <string>

namespace pour {

    // Bottle or layout built with more layers than the capacity allows
    struct CapacityError : std::length_error {
        using std::length_error::length_error;
    };

    // Bottle index outside [0, N)
    struct IndexError : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    // Pour requested although canPour() is false
    struct TransfusionError : std::logic_error {
        using std::logic_error::logic_error;
    };

} // namespace pour
