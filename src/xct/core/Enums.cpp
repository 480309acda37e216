#include "xct/core/Enums.hpp"

namespace xct {
    Backend::Backend(std::string_view name) {
        const std::string lowercase = to_lower(trim(name));
        if (lowercase == "cpu")
            value = CPU;
        else if (lowercase == "gpu")
            value = GPU;
        else
            panic<UnsupportedBackendError>("Unsupported backend \"{}\". Should be \"cpu\" or \"gpu\"", name);
    }

    std::ostream& operator<<(std::ostream& os, Backend backend) {
        switch (backend) {
            case Backend::CPU:
                return os << "cpu";
            case Backend::GPU:
                return os << "gpu";
        }
        return os;
    }

    std::ostream& operator<<(std::ostream& os, Quadrant quadrant) {
        switch (quadrant) {
            case Quadrant::FIRST:
                return os << "Quadrant::FIRST";
            case Quadrant::SECOND:
                return os << "Quadrant::SECOND";
            case Quadrant::THIRD:
                return os << "Quadrant::THIRD";
            case Quadrant::FOURTH:
                return os << "Quadrant::FOURTH";
        }
        return os;
    }

    std::ostream& operator<<(std::ostream& os, Branch branch) {
        switch (branch) {
            case Branch::ASIN:
                return os << "Branch::ASIN";
            case Branch::ACOS:
                return os << "Branch::ACOS";
        }
        return os;
    }
}
