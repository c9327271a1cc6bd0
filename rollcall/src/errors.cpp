#include "rollcall/errors.h"

using namespace rollcall;

int rollcall::exit_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingDependency: return 3;
    case ErrorKind::NotFound:          return 4;
    case ErrorKind::Configuration:     return 5;
    case ErrorKind::Runtime:           return 6;
    }
    return 1;
}

const char* rollcall::to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingDependency: return "missing dependency";
    case ErrorKind::NotFound:          return "not found";
    case ErrorKind::Configuration:     return "configuration";
    case ErrorKind::Runtime:           return "runtime";
    }
    return "unknown";
}
