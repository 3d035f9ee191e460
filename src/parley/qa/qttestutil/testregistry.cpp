/*
 * testregistry.cpp - registry of QtTest test objects
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

#include "testregistry.h"

#include <QObject>
#include <QtTest/QtTest>

namespace Parley { namespace TestUtil {

TestRegistry *TestRegistry::getInstance()
{
    static TestRegistry registry;
    return &registry;
}

void TestRegistry::registerTest(QObject *test) { tests_ += test; }

int TestRegistry::runTests(int argc, char *argv[])
{
    QString     only;
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (only.isEmpty() && !arg.startsWith(QLatin1Char('-')) && i == 1)
            only = arg;
        else
            args << arg;
    }

    int failed = 0;
    for (QObject *test : std::as_const(tests_)) {
        if (!only.isEmpty() && only != QLatin1String(test->metaObject()->className()))
            continue;
        if (QTest::qExec(test, args) != 0)
            ++failed;
    }
    return failed;
}

} } // namespace Parley::TestUtil
