#pragma once
#include <stdexcept>

// Connection level failure: not connected, peer gone, broken or malformed stream
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
