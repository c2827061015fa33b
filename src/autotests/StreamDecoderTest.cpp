/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StreamDecoderTest.h"

#include <QTest>

#include "../terminal/StreamDecoder.h"

using namespace Synk;

namespace
{
// U+1F600 GRINNING FACE
const QByteArray FourByteCharacter("\xF0\x9F\x98\x80");
const QString FourByteString = QString::fromUtf8(FourByteCharacter);
}

void StreamDecoderTest::testAscii()
{
    StreamDecoder decoder;
    QCOMPARE(decoder.decode("hello\r\n"), QStringLiteral("hello\r\n"));
    QCOMPARE(decoder.decode(QByteArray()), QString());
}

void StreamDecoderTest::testSplitFourByteCharacter_data()
{
    QTest::addColumn<int>("split");

    QTest::newRow("1+3") << 1;
    QTest::newRow("2+2") << 2;
    QTest::newRow("3+1") << 3;
}

void StreamDecoderTest::testSplitFourByteCharacter()
{
    QFETCH(int, split);

    StreamDecoder decoder;
    const QByteArray data = "a" + FourByteCharacter + "b";
    const QString first = decoder.decode(data.left(1 + split));
    const QString second = decoder.decode(data.mid(1 + split));

    QCOMPARE(first, QStringLiteral("a"));
    QCOMPARE(first + second, QStringLiteral("a") + FourByteString + QStringLiteral("b"));
    QVERIFY(!(first + second).contains(QChar::ReplacementCharacter));
}

void StreamDecoderTest::testByteAtATime()
{
    StreamDecoder decoder;
    const QByteArray data = QByteArray("x") + FourByteCharacter + "\xC3\xA9" + "\xE2\x82\xAC";
    QString result;
    for (char c : data) {
        result += decoder.decode(QByteArray(1, c));
    }
    QCOMPARE(result, QString::fromUtf8(data));
}

void StreamDecoderTest::testMalformedInputIsReplaced()
{
    StreamDecoder decoder;
    const QString result = decoder.decode("a\xFF" "b");
    QCOMPARE(result.front(), QChar(QLatin1Char('a')));
    QCOMPARE(result.back(), QChar(QLatin1Char('b')));
    QVERIFY(result.contains(QChar::ReplacementCharacter));

    // The stream carries on normally afterwards
    QCOMPARE(decoder.decode("ok"), QStringLiteral("ok"));
}

void StreamDecoderTest::testDecodersAreIndependent()
{
    StreamDecoder first;
    StreamDecoder second;

    QCOMPARE(first.decode(FourByteCharacter.left(2)), QString());
    QCOMPARE(second.decode("plain"), QStringLiteral("plain"));
    QCOMPARE(first.decode(FourByteCharacter.mid(2)), FourByteString);
}

void StreamDecoderTest::testReset()
{
    StreamDecoder decoder;
    QCOMPARE(decoder.decode(FourByteCharacter.left(3)), QString());
    decoder.reset();
    QCOMPARE(decoder.decode("z"), QStringLiteral("z"));
}

QTEST_GUILESS_MAIN(StreamDecoderTest)
