/*
 * qttestutil.h - test registration macro
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

#ifndef PARLEY_QTTESTUTIL_H
#define PARLEY_QTTESTUTIL_H

#include "parley/qa/qttestutil/testregistration.h"

/**
 * Registers a QtTest class with the test registry. Put it in the body of
 * the test's .cpp file:
 *
 *     class MyTest : public QObject {
 *         ...
 *     };
 *
 *     PARLEY_REGISTER_TEST(MyTest);
 */
#define PARLEY_REGISTER_TEST(TestClass)                                                                                \
    static Parley::TestUtil::TestRegistration<TestClass> TestClass##Registration

#endif // PARLEY_QTTESTUTIL_H
