#pragma once

#include <string>

namespace holdtalk {

struct InjectionResult {
    bool success = false;
    std::string error;
};

// Delivers text to the focused window. Implementations usually type through
// a virtual input device, which DeviceFilter must classify as synthetic.
class TextInjector {
public:
    virtual ~TextInjector() = default;

    virtual InjectionResult inject(const std::string& text) = 0;
    virtual const char* name() const = 0;
};

} // namespace holdtalk
