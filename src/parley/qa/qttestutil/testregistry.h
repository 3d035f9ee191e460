/*
 * testregistry.h - registry of QtTest test objects
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

#ifndef PARLEY_TESTREGISTRY_H
#define PARLEY_TESTREGISTRY_H

#include <QList>

class QObject;

namespace Parley { namespace TestUtil {

/**
 * All test classes registered with PARLEY_REGISTER_TEST add themselves
 * here. runTests() then runs them in registration order.
 */
class TestRegistry {
public:
    static TestRegistry *getInstance();

    // called by PARLEY_REGISTER_TEST, not meant for direct use
    void registerTest(QObject *test);

    /**
     * Runs every registered test with QTest::qExec(). An optional first
     * argument selects a single test class by name. Returns the number
     * of failed test classes.
     */
    int runTests(int argc, char *argv[]);

private:
    TestRegistry() { }

    QList<QObject *> tests_;
};

} } // namespace Parley::TestUtil

#endif // PARLEY_TESTREGISTRY_H
