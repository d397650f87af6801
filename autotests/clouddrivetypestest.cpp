/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/clouddrivetypes.h"

#include <QTest>

using namespace CloudDrive;

class CloudDriveTypesTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testContentRange_data();
    void testContentRange();
    void testRangeValidity_data();
    void testRangeValidity();
    void testErrorToString();
    void testDefaultErrorIsNoError();
};

QTEST_GUILESS_MAIN(CloudDriveTypesTest)

void CloudDriveTypesTest::testContentRange_data()
{
    QTest::addColumn<qint64>("lower");
    QTest::addColumn<qint64>("upper");
    QTest::addColumn<qint64>("total");
    QTest::addColumn<QByteArray>("expected");

    QTest::newRow("first part") << qint64(0) << qint64(100) << qint64(250) << QByteArrayLiteral("bytes 0-99/250");
    QTest::newRow("last part") << qint64(200) << qint64(250) << qint64(250) << QByteArrayLiteral("bytes 200-249/250");
    QTest::newRow("single byte") << qint64(0) << qint64(1) << qint64(1) << QByteArrayLiteral("bytes 0-0/1");
    QTest::newRow("large file") << qint64(4294967296) << qint64(4299210752) << qint64(8589934592)
                                << QByteArrayLiteral("bytes 4294967296-4299210751/8589934592");
}

void CloudDriveTypesTest::testContentRange()
{
    QFETCH(qint64, lower);
    QFETCH(qint64, upper);
    QFETCH(qint64, total);
    QFETCH(QByteArray, expected);

    const TransferRange range{lower, upper};
    QCOMPARE(range.toContentRange(total), expected);
    QCOMPARE(range.length(), upper - lower);
}

void CloudDriveTypesTest::testRangeValidity_data()
{
    QTest::addColumn<qint64>("lower");
    QTest::addColumn<qint64>("upper");
    QTest::addColumn<bool>("valid");

    // Total size 250
    QTest::newRow("inside") << qint64(100) << qint64(200) << true;
    QTest::newRow("whole") << qint64(0) << qint64(250) << true;
    QTest::newRow("empty") << qint64(100) << qint64(100) << false;
    QTest::newRow("reversed") << qint64(200) << qint64(100) << false;
    QTest::newRow("negative") << qint64(-10) << qint64(10) << false;
    QTest::newRow("past the end") << qint64(200) << qint64(251) << false;
}

void CloudDriveTypesTest::testRangeValidity()
{
    QFETCH(qint64, lower);
    QFETCH(qint64, upper);
    QFETCH(bool, valid);

    QCOMPARE((TransferRange{lower, upper}).isValidFor(250), valid);
}

void CloudDriveTypesTest::testErrorToString()
{
    Error error(Error::ProviderReportedError, QStringLiteral("itemNotFound: gone"), 404);
    error.path = QStringLiteral("/Documents");
    error.range = TransferRange{0, 100};

    const QString text = error.toString();
    QVERIFY(text.startsWith(QStringLiteral("ProviderReportedError (HTTP 404): itemNotFound: gone")));
    QVERIFY(text.contains(QStringLiteral("[path: /Documents]")));
    QVERIFY(text.contains(QStringLiteral("[range: 0-100)")));

    QCOMPARE(Error::kindName(Error::PaginationProtocolError), QStringLiteral("PaginationProtocolError"));
    QCOMPARE(Error(Error::Cancelled, QString()).toString(), QStringLiteral("Cancelled"));
}

void CloudDriveTypesTest::testDefaultErrorIsNoError()
{
    const Error error;
    QVERIFY(!error.isError());
    QCOMPARE(error.kind, Error::NoError);
    QCOMPARE(error.httpStatus, 0);
    QVERIFY(!error.range);
}

#include "clouddrivetypestest.moc"
