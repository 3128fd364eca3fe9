// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "TestGlobal.h"

#include "TestCommon.h"

#include "../src/global/CaseUtils.h"
#include "../src/global/HideQDebug.h"
#include "../src/global/ImmUnorderedMap.h"
#include "../src/global/NullPointerException.h"
#include "../src/global/hash.h"
#include "../src/global/logging.h"
#include "../src/global/utils.h"

#include <memory>
#include <tuple>

#include <QDebug>
#include <QStringList>
#include <QtTest/QtTest>

TestGlobal::TestGlobal() = default;

TestGlobal::~TestGlobal() = default;

void TestGlobal::caseUtilsTest()
{
    test::testCaseUtils();

    QVERIFY(areEqualAsLowerAscii("XTERM256", "xterm256"));
    QVERIFY(!areEqualAsLowerAscii("xterm256", "xterm25"));
    QCOMPARE(toLowerAscii(std::string_view{"Named-RGB"}), std::string{"named-rgb"});
}

void TestGlobal::hashTest()
{
    QCOMPARE(numeric_hash(42u), numeric_hash(42u));
    QVERIFY(numeric_hash(42u) != numeric_hash(43u));
    QVERIFY(hash_combine(1, 2) != hash_combine(2, 1));
}

void TestGlobal::hideQDebugTest()
{
    static constexpr auto onlyDebug = []() {
        tcqt::HideQDebugOptions tmp;
        tmp.hideInfo = false;
        return tmp;
    }();

    static constexpr auto onlyInfo = []() {
        tcqt::HideQDebugOptions tmp;
        tmp.hideDebug = false;
        return tmp;
    }();

    const QString expected = "1{DIW}\n2{DW}\n3{DIW}\n4{IW}\n5{DIW}\n"
                             "---\n"
                             "1{W}\n2{W}\n3{W}\n4{W}\n5{W}\n"
                             "---\n"
                             "1{DIW}\n2{DW}\n3{DIW}\n4{IW}\n5{DIW}\n";

    static QString tmp;

    auto testCase = [](int n) {
        tmp += QString::number(n);
        tmp += "{";
        qDebug() << n;
        qInfo() << n;
        qWarning() << n;
        tmp += "}\n";
    };

    auto testAlternations = [&testCase]() {
        testCase(1);
        {
            tcqt::HideQDebug hide{onlyInfo};
            testCase(2);
        }
        testCase(3);
        {
            tcqt::HideQDebug hide{onlyDebug};
            testCase(4);
        }
        testCase(5);
    };

    static auto localMessageHandler =
        [](const QtMsgType type, const QMessageLogContext &, const QString &) {
            switch (type) {
            case QtDebugMsg:
                tmp += "D";
                break;
            case QtWarningMsg:
                tmp += "W";
                break;
            case QtCriticalMsg:
                tmp += "C";
                break;
            case QtFatalMsg:
                tmp += "F";
                break;
            case QtInfoMsg:
                tmp += "I";
                break;
            }
        };

    tmp.clear();
    const auto old = qInstallMessageHandler(localMessageHandler);
    testAlternations();
    tmp += "---\n";
    {
        tcqt::HideQDebug hideBoth;
        testAlternations();
    }
    tmp += "---\n";
    testAlternations();
    qInstallMessageHandler(old);

    QCOMPARE(tmp, expected);
}

void TestGlobal::immUnorderedMapTest()
{
    ImmUnorderedMap<int, std::string> a;
    QVERIFY(a.empty());
    a.set(1, "one");
    const ImmUnorderedMap<int, std::string> snapshot = a;
    a.set(2, "two");

    QCOMPARE(a.size(), size_t{2});
    QCOMPARE(snapshot.size(), size_t{1});
    QVERIFY(!snapshot.contains(2));
    QVERIFY(a.find(2) != nullptr);
    QCOMPARE(*a.find(1), std::string{"one"});
    QVERIFY(a.find(3) == nullptr);
}

void TestGlobal::loggingTest()
{
    static QStringList messages;
    static QList<QtMsgType> types;
    static auto capture = [](const QtMsgType type, const QMessageLogContext &, const QString &msg) {
        types.append(type);
        messages.append(msg);
    };

    messages.clear();
    types.clear();
    const auto old = qInstallMessageHandler(capture);
    TCLOG_INFO() << "value=" << 42;
    TCLOG_WARNING() << "first\nsecond";
    TCLOG_DEBUG() << std::string{"debug "} << QString{"text"};
    qInstallMessageHandler(old);

    QCOMPARE(messages.size(), 3);
    QCOMPARE(messages.at(0), QString{"value=42"});
    QCOMPARE(types.at(0), QtInfoMsg);
    QCOMPARE(messages.at(1), QString{"first\nsecond"});
    QCOMPARE(types.at(1), QtWarningMsg);
    QCOMPARE(messages.at(2), QString{"debug text"});
    QCOMPARE(types.at(2), QtDebugMsg);
}

void TestGlobal::utilsTest()
{
    QVERIFY(isClamped(5, 0, 10));
    QVERIFY(!isClamped(11, 0, 10));
    QCOMPARE(utils::clampToByte(-3.0), 0);
    QCOMPARE(utils::clampToByte(127.5), 128);
    QCOMPARE(utils::clampToByte(300.0), 255);

    int value = 7;
    QCOMPARE(deref(&value), 7);
    int *const null = nullptr;
    QVERIFY(throwsException<NullPointerException>([null]() { std::ignore = deref(null); }));

    const auto shared = std::make_shared<int>(3);
    QCOMPARE(deref(shared), 3);
}

QTEST_MAIN(TestGlobal)
