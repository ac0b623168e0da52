//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Defines the built-in round-trip cases and their canonical values.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Harness/CaseRegistry.h"

#include "borshrt/Harness/HarnessError.h"
#include "llvm/ADT/STLExtras.h"

#include <memory>
#include <string>
#include <utility>

namespace borshrt
{
namespace
{

Person makePerson(std::string name, const std::uint64_t age, const double prob, std::vector<std::int32_t> data)
{
    Person person;
    person.name = std::move(name);
    person.age  = llvm::APInt(128, age);
    person.prob = prob;
    person.data = std::move(data);
    return person;
}

Hole makeHole(const std::uint32_t age, const std::int16_t first, const std::int16_t second, std::unique_ptr<Hole> inner)
{
    Hole hole;
    hole.age   = age;
    hole.id    = {first, second};
    hole.inner = std::move(inner);
    return hole;
}

}  // namespace

llvm::StringRef caseTypeName(const CaseValue& value)
{
    switch (value.index())
    {
    case 0:
        return "Person";
    case 1:
        return "Hole";
    case 2:
        return "Tally";
    case 3:
        return "Exists";
    default:
        return "<valueless>";
    }
}

CaseRegistry::CaseRegistry()
{
    cases_.push_back(TestCase{0, "person-ccccc", makePerson("ccccc", 541212312321534534ULL, 0.69, {31, 69})});
    cases_.push_back(TestCase{1, "person-empty", makePerson("", 699, 0.01, {})});
    cases_.push_back(TestCase{2, "hole-leaf", makeHole(69, 3, 9, nullptr)});
    cases_.push_back(
        TestCase{3, "hole-nested", makeHole(1131, 3, 10, std::make_unique<Hole>(makeHole(1333, 6, 9, nullptr)))});
    cases_.push_back(TestCase{4, "tally-two", Tally::Two});
    cases_.push_back(TestCase{5, "exists-no", Exists{std::monostate{}}});
    cases_.push_back(TestCase{6, "exists-yes", Exists{ExistsYes{std::monostate{}, true}}});
}

const CaseRegistry& CaseRegistry::builtin()
{
    static const CaseRegistry registry;
    return registry;
}

llvm::Expected<const TestCase&> CaseRegistry::resolve(const std::uint8_t id) const
{
    const auto it = llvm::find_if(cases_, [id](const TestCase& c) { return c.id == id; });
    if (it == cases_.end())
    {
        return llvm::make_error<HarnessError>(HarnessErrc::UnsupportedCase,
                                              "no case registered for id " + std::to_string(id),
                                              id);
    }
    return *it;
}

}  // namespace borshrt
