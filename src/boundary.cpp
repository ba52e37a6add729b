#include "wordmatch/boundary.h"

namespace wordmatch {

bool is_word(Boundary boundary) {
    switch (boundary) {
        case Boundary::Start:
        case Boundary::Word:
        case Boundary::End:
        case Boundary::Mixed:
            return true;
        case Boundary::NoContent:
            return false;
    }
    return false;
}

const char* boundary_name(Boundary boundary) {
    switch (boundary) {
        case Boundary::Start:
            return "Start";
        case Boundary::Word:
            return "Word";
        case Boundary::End:
            return "End";
        case Boundary::Mixed:
            return "Mixed";
        case Boundary::NoContent:
            return "NoContent";
    }
    return "NoContent";
}

char boundary_code(Boundary boundary) {
    switch (boundary) {
        case Boundary::Start:
            return 'S';
        case Boundary::Word:
            return 'W';
        case Boundary::End:
            return 'E';
        case Boundary::Mixed:
            return 'M';
        case Boundary::NoContent:
            return '_';
    }
    return '_';
}

std::ostream& operator<<(std::ostream& os, Boundary boundary) {
    return os << boundary_name(boundary);
}

} // namespace wordmatch
