/*
 * testregistration.h - static registration of a test class
 * Copyright (C) 2026  Parley developers
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library.  If not, see <https://www.gnu.org/licenses/>.
 *
 */

#ifndef PARLEY_TESTREGISTRATION_H
#define PARLEY_TESTREGISTRATION_H

#include "parley/qa/qttestutil/testregistry.h"

namespace Parley { namespace TestUtil {

/**
 * Creates one instance of TestClass and hands it to the registry.
 * Used by PARLEY_REGISTER_TEST().
 */
template <typename TestClass> class TestRegistration {
public:
    TestRegistration()
    {
        test_ = new TestClass();
        TestRegistry::getInstance()->registerTest(test_);
    }

    ~TestRegistration() { delete test_; }

private:
    TestClass *test_;
};

} } // namespace Parley::TestUtil

#endif // PARLEY_TESTREGISTRATION_H
