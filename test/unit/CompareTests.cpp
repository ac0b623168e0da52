//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>

#include "borshrt/Codec/Compare.h"
#include "borshrt/Harness/CaseTypes.h"

namespace
{

borshrt::Person samplePerson()
{
    borshrt::Person person;
    person.name = "ccccc";
    person.age  = llvm::APInt(128, 699);
    person.prob = 0.69;
    person.data = {31, 69};
    return person;
}

borshrt::Hole sampleHole()
{
    borshrt::Hole hole;
    hole.age          = 1131;
    hole.id           = {3, 10};
    hole.inner        = std::make_unique<borshrt::Hole>();
    hole.inner->age   = 1333;
    hole.inner->id    = {6, 9};
    return hole;
}

}  // namespace

bool runCompareTests()
{
    {
        if (!borshrt::structurallyEqual(samplePerson(), samplePerson()) ||
            !borshrt::structurallyEqual(sampleHole(), sampleHole()))
        {
            std::cerr << "identical values reported as different\n";
            return false;
        }
    }

    {
        borshrt::Person other = samplePerson();
        other.data[1]         = 70;
        const auto diff       = borshrt::findFirstDifference(samplePerson(), other);
        if (!diff || diff->path != "data[1]" || diff->expected != "69" || diff->actual != "70")
        {
            std::cerr << "sequence element difference not reported at data[1]\n";
            return false;
        }
    }

    {
        borshrt::Person other = samplePerson();
        other.data.push_back(1);
        const auto diff = borshrt::findFirstDifference(samplePerson(), other);
        if (!diff || diff->path != "data" || diff->expected != "length 2" || diff->actual != "length 3")
        {
            std::cerr << "sequence length difference not reported\n";
            return false;
        }
    }

    {
        borshrt::Person other = samplePerson();
        other.name            = "cccc";
        other.age             = llvm::APInt(128, 700);
        const auto diff       = borshrt::findFirstDifference(samplePerson(), other);
        if (!diff || diff->path != "name" || diff->expected != "\"ccccc\"")
        {
            std::cerr << "first differing field should be name\n";
            return false;
        }
    }

    {
        borshrt::Person other = samplePerson();
        other.age             = llvm::APInt(128, 700);
        const auto diff       = borshrt::findFirstDifference(samplePerson(), other);
        if (!diff || diff->path != "age" || diff->expected != "699" || diff->actual != "700")
        {
            std::cerr << "128-bit field difference not rendered in decimal\n";
            return false;
        }
    }

    {
        borshrt::Person negZero = samplePerson();
        borshrt::Person posZero = samplePerson();
        negZero.prob            = -0.0;
        posZero.prob            = 0.0;
        if (borshrt::structurallyEqual(negZero, posZero))
        {
            std::cerr << "signed zeros compared equal\n";
            return false;
        }
        borshrt::Person nanA = samplePerson();
        borshrt::Person nanB = samplePerson();
        nanA.prob            = std::numeric_limits<double>::quiet_NaN();
        nanB.prob            = nanA.prob;
        if (!borshrt::structurallyEqual(nanA, nanB))
        {
            std::cerr << "identical NaN bit patterns compared unequal\n";
            return false;
        }
    }

    {
        borshrt::Hole other = sampleHole();
        other.inner->id[1]  = 8;
        const auto diff     = borshrt::findFirstDifference(sampleHole(), other);
        if (!diff || diff->path != "inner.id[1]")
        {
            std::cerr << "nested array difference not reported at inner.id[1]\n";
            return false;
        }

        other.inner.reset();
        const auto presence = borshrt::findFirstDifference(sampleHole(), other);
        if (!presence || presence->path != "inner" || presence->expected != "present" ||
            presence->actual != "absent")
        {
            std::cerr << "optional presence difference not reported\n";
            return false;
        }
    }

    {
        const auto diff = borshrt::findFirstDifference(borshrt::Tally::Two, borshrt::Tally::Three);
        if (!diff || !diff->path.empty() || diff->expected != "Two" || diff->actual != "Three")
        {
            std::cerr << "enum difference not rendered by enumerator name\n";
            return false;
        }
    }

    {
        const borshrt::Exists no{};
        const borshrt::Exists yes{borshrt::ExistsYes{std::monostate{}, true}};
        const borshrt::Exists yesFalse{borshrt::ExistsYes{std::monostate{}, false}};
        const auto            alt = borshrt::findFirstDifference(yes, no);
        if (!alt || alt->expected != "alternative 1" || alt->actual != "alternative 0")
        {
            std::cerr << "union alternative difference not reported\n";
            return false;
        }
        const auto payload = borshrt::findFirstDifference(yes, yesFalse);
        if (!payload || payload->path != "b" || payload->expected != "true")
        {
            std::cerr << "union payload difference not reported at b\n";
            return false;
        }
    }

    return true;
}
