/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/dataprovider.h"

#include <QTemporaryFile>
#include <QTest>

using namespace CloudDrive;

class DataProviderTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testBufferProvider_data();
    void testBufferProvider();
    void testFileProvider();
    void testFileProviderRangePastEnd();
    void testFileProviderMissingFile();
    void testFileProviderSeesFileChanges();
};

QTEST_GUILESS_MAIN(DataProviderTest)

void DataProviderTest::testBufferProvider_data()
{
    QTest::addColumn<qint64>("lower");
    QTest::addColumn<qint64>("upper");
    QTest::addColumn<bool>("success");
    QTest::addColumn<QByteArray>("expected");

    QTest::newRow("head") << qint64(0) << qint64(4) << true << QByteArrayLiteral("0123");
    QTest::newRow("middle") << qint64(4) << qint64(7) << true << QByteArrayLiteral("456");
    QTest::newRow("tail") << qint64(7) << qint64(10) << true << QByteArrayLiteral("789");
    QTest::newRow("whole buffer") << qint64(0) << qint64(10) << true << QByteArrayLiteral("0123456789");
    QTest::newRow("past the end") << qint64(8) << qint64(12) << false << QByteArray();
    QTest::newRow("empty range") << qint64(3) << qint64(3) << false << QByteArray();
    QTest::newRow("negative start") << qint64(-1) << qint64(2) << false << QByteArray();
}

void DataProviderTest::testBufferProvider()
{
    QFETCH(qint64, lower);
    QFETCH(qint64, upper);
    QFETCH(bool, success);
    QFETCH(QByteArray, expected);

    const DataProvider provider = bufferDataProvider(QByteArrayLiteral("0123456789"));
    const DataResult result = provider(TransferRange{lower, upper});

    QCOMPARE(result.success, success);
    QCOMPARE(result.data, expected);
    QCOMPARE(result.errorMessage.isEmpty(), success);
}

void DataProviderTest::testFileProvider()
{
    QTemporaryFile file;
    QVERIFY(file.open());
    QVERIFY(file.write(QByteArrayLiteral("abcdefghijklmnopqrstuvwxyz")) == 26);
    QVERIFY(file.flush());

    const DataProvider provider = fileDataProvider(file.fileName());

    // Parts may be requested again and out of order
    const DataResult second = provider(TransferRange{10, 20});
    QVERIFY(second.success);
    QCOMPARE(second.data, QByteArrayLiteral("klmnopqrst"));

    const DataResult first = provider(TransferRange{0, 10});
    QVERIFY(first.success);
    QCOMPARE(first.data, QByteArrayLiteral("abcdefghij"));

    const DataResult last = provider(TransferRange{20, 26});
    QVERIFY(last.success);
    QCOMPARE(last.data, QByteArrayLiteral("uvwxyz"));
}

void DataProviderTest::testFileProviderRangePastEnd()
{
    QTemporaryFile file;
    QVERIFY(file.open());
    QVERIFY(file.write(QByteArrayLiteral("short")) == 5);
    QVERIFY(file.flush());

    const DataResult result = fileDataProvider(file.fileName())(TransferRange{0, 10});

    QVERIFY(!result.success);
    QVERIFY(result.data.isEmpty());
    QVERIFY(!result.errorMessage.isEmpty());
}

void DataProviderTest::testFileProviderMissingFile()
{
    const DataResult result = fileDataProvider(QStringLiteral("/nonexistent/clouddrive/upload.bin"))(TransferRange{0, 1});

    QVERIFY(!result.success);
    QVERIFY(result.errorMessage.contains(QStringLiteral("/nonexistent/clouddrive/upload.bin")));
}

void DataProviderTest::testFileProviderSeesFileChanges()
{
    QTemporaryFile file;
    QVERIFY(file.open());
    QVERIFY(file.write(QByteArrayLiteral("aaaa")) == 4);
    QVERIFY(file.flush());

    const DataProvider provider = fileDataProvider(file.fileName());
    QCOMPARE(provider(TransferRange{0, 4}).data, QByteArrayLiteral("aaaa"));

    // The file is reopened for every part
    QVERIFY(file.seek(0));
    QVERIFY(file.write(QByteArrayLiteral("bbbb")) == 4);
    QVERIFY(file.flush());
    QCOMPARE(provider(TransferRange{0, 4}).data, QByteArrayLiteral("bbbb"));
}

#include "dataprovidertest.moc"
