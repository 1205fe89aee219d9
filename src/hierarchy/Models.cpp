#include "hierarchy/Models.hpp"

namespace hierarchy {

const char* verdict_str(Verdict v) {
    switch (v) {
        case Verdict::Valid: return "VALID";
        case Verdict::Invalid: return "INVALID";
        default: return "INVALID";
    }
}

const char* verdict_status_str(Verdict v) {
    switch (v) {
        case Verdict::Valid: return "PASS";
        case Verdict::Invalid: return "FAIL";
        default: return "FAIL";
    }
}

}  // namespace hierarchy
