#pragma once

#include <folio/source.h>

#include <string>

namespace folio::detail {

class MemorySource : public Source {
public:
    MemorySource(std::string bytes, std::string name);

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;

private:
    std::string bytes_;
    std::string name_;
    std::size_t pos_ = 0;
};

} // namespace folio::detail
