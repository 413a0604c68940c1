#pragma once

#include "source/source_adapter.hpp"
#include <gmock/gmock.h>

namespace webhunter {
namespace testing {

class MockSourceAdapter : public webhunter::SourceAdapter {
public:
    MOCK_METHOD(std::string, get_kind, (), (const, override));
    MOCK_METHOD(std::vector<webhunter::Listing>, fetch, (const webhunter::SourceConfig&), (override));
};

} // namespace testing
} // namespace webhunter
