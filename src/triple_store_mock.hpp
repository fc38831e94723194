#pragma once
#include <gmock/gmock.h>
#include "triple_store.hpp"

class TripleStoreMock : public TripleStoreInterface {
public:
    MOCK_METHOD(mw::E<void>, init, (), (override));
    MOCK_METHOD(mw::E<std::vector<Triple>>, findTriples, (const std::string&, const std::string&), (override));
    MOCK_METHOD(mw::E<void>, removeTriples, (const std::string&, const std::string&), (override));
    MOCK_METHOD(mw::E<void>, addTriple, (const Triple&), (override));
};
