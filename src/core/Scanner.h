#pragma once
#include <string>
#include <memory>

namespace hulud_scan {

struct ScanContext; // fwd

class Scanner {
public:
    virtual ~Scanner() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual void scan(ScanContext& context) = 0;
};

using ScannerPtr = std::unique_ptr<Scanner>;

}
