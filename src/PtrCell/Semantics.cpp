#include "PtrCell/Semantics.hpp"

#include <ostream>

const char* toString(Semantics semantics) noexcept {
    switch (semantics) {
        case Semantics::Relaxed: return "Relaxed";
        case Semantics::Coupled: return "Coupled";
        case Semantics::Ordered: return "Ordered";
    }
    return "Unknown";
}

const char* toString(MemoryOrder order) noexcept {
    switch (order) {
        case MemoryOrder::Relaxed: return "Relaxed";
        case MemoryOrder::Acquire: return "Acquire";
        case MemoryOrder::Release: return "Release";
        case MemoryOrder::AcqRel:  return "AcqRel";
        case MemoryOrder::SeqCst:  return "SeqCst";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, Semantics semantics) {
    return os << toString(semantics);
}

std::ostream& operator<<(std::ostream& os, MemoryOrder order) {
    return os << toString(order);
}
