/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "scanner.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "errors.h"
#include "faketransport.h"

using Catch::Matchers::ContainsSubstring;

static const QUrl baseUrl{QStringLiteral("http://192.168.1.30:8080/")};

static QByteArray readFile(const QString &path) {
    QFile file{path};
    if (!file.open(QIODevice::ReadOnly)) return {};
    return file.readAll();
}

TEST_CASE("Scanner identity", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    MapCredentials credentials;

    SECTION("identity is loaded once at construction") {
        transport->route(QStringLiteral("/hello.json"), helloJson());

        Scanner scanner{baseUrl, transport, credentials};
        REQUIRE(transport->count(QStringLiteral("/hello.json")) == 1);

        for (int i = 0; i < 5; ++i) {
            const auto &identity = scanner.identity();
            CHECK(identity.model == QStringLiteral("DX250"));
            CHECK(identity.name == QStringLiteral("Doxie_062B08"));
            CHECK(identity.mac == QStringLiteral("00:11:E5:06:2B:08"));
            CHECK(identity.firmwareWifi == QStringLiteral("1.29"));
            CHECK(identity.mode == Scanner::Mode::Host);
            CHECK_FALSE(identity.network.has_value());
        }

        CHECK(transport->requests().size() == 1);
        CHECK_FALSE(scanner.authenticated());
        CHECK(scanner.description() ==
              QStringLiteral("Doxie model DX250 (Doxie_062B08) at "
                             "http://192.168.1.30:8080/"));
    }

    SECTION("network is read in client mode") {
        transport->route(QStringLiteral("/hello.json"), helloJson("Client"));

        Scanner scanner{baseUrl, transport, credentials};

        CHECK(scanner.identity().mode == Scanner::Mode::Client);
        REQUIRE(scanner.identity().network.has_value());
        CHECK(*scanner.identity().network == QStringLiteral("HomeWifi"));
    }

    SECTION("unreachable device fails construction") {
        transport->drop(QStringLiteral("/hello.json"));

        REQUIRE_THROWS_AS(Scanner(baseUrl, transport, credentials),
                          DeviceUnreachable);
    }

    SECTION("error status on hello is a protocol error") {
        transport->route(QStringLiteral("/hello.json"), {}, 500);

        REQUIRE_THROWS_AS(Scanner(baseUrl, transport, credentials),
                          DeviceProtocolError);
    }
}

TEST_CASE("Identity parser fails closed", "[scanner]") {
    const auto complete =
        QJsonDocument::fromJson(helloJson("Client")).object();

    SECTION("every required field") {
        for (const auto *key : {"model", "name", "MAC", "mode", "firmwareWiFi",
                                "hasPassword", "network"}) {
            auto obj = complete;
            obj.remove(QLatin1String(key));
            INFO("missing field: " << key);
            CHECK_THROWS_AS(
                Scanner::parseIdentity(QJsonDocument{obj}.toJson()),
                DeviceProtocolError);
        }
    }

    SECTION("network is not required in host mode") {
        auto obj = complete;
        obj.insert(QStringLiteral("mode"), QStringLiteral("AP"));
        obj.remove(QStringLiteral("network"));

        auto identity = Scanner::parseIdentity(QJsonDocument{obj}.toJson());

        CHECK(identity.mode == Scanner::Mode::Host);
        CHECK_FALSE(identity.network.has_value());
    }

    SECTION("wrong field type") {
        auto obj = complete;
        obj.insert(QStringLiteral("hasPassword"), QStringLiteral("yes"));

        CHECK_THROWS_AS(Scanner::parseIdentity(QJsonDocument{obj}.toJson()),
                        DeviceProtocolError);
    }

    SECTION("unknown mode") {
        auto obj = complete;
        obj.insert(QStringLiteral("mode"), QStringLiteral("Mesh"));

        CHECK_THROWS_AS(Scanner::parseIdentity(QJsonDocument{obj}.toJson()),
                        DeviceProtocolError);
    }

    SECTION("not json") {
        CHECK_THROWS_AS(Scanner::parseIdentity("<html></html>"),
                        DeviceProtocolError);
        CHECK_THROWS_AS(Scanner::parseIdentity("[]"), DeviceProtocolError);
    }
}

TEST_CASE("Firmware detail cache", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    MapCredentials credentials;
    transport->route(QStringLiteral("/hello.json"), helloJson());
    transport->route(
        QStringLiteral("/hello_extra.json"),
        R"({"firmware":"0.26","connectedToExternalPower":true})");

    Scanner scanner{baseUrl, transport, credentials};

    SECTION("firmware detail is fetched once") {
        for (int i = 0; i < 5; ++i)
            CHECK(scanner.firmwareDetail() == QStringLiteral("0.26"));

        CHECK(transport->count(QStringLiteral("/hello_extra.json")) == 1);
    }

    SECTION("power state is fetched on every call") {
        for (int i = 0; i < 3; ++i) CHECK(scanner.isOnExternalPower());

        CHECK(transport->count(QStringLiteral("/hello_extra.json")) == 3);

        transport->route(
            QStringLiteral("/hello_extra.json"),
            R"({"firmware":"0.26","connectedToExternalPower":false})");

        CHECK_FALSE(scanner.isOnExternalPower());
        CHECK(transport->count(QStringLiteral("/hello_extra.json")) == 4);
    }

    SECTION("power state call fills the firmware cache") {
        scanner.isOnExternalPower();
        CHECK(scanner.firmwareDetail() == QStringLiteral("0.26"));

        CHECK(transport->count(QStringLiteral("/hello_extra.json")) == 1);
    }

    SECTION("missing firmware field") {
        transport->route(QStringLiteral("/hello_extra.json"),
                         R"({"connectedToExternalPower":true})");

        CHECK_THROWS_AS(scanner.firmwareDetail(), DeviceProtocolError);
    }
}

TEST_CASE("Scanner authentication", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->route(QStringLiteral("/hello.json"), helloJson("AP", true));
    transport->route(QStringLiteral("/scans.json"), "[]");
    MapCredentials credentials;

    SECTION("authenticated calls carry basic credentials") {
        credentials.passwords.insert(QStringLiteral("00:11:E5:06:2B:08"),
                                     QStringLiteral("secret"));

        Scanner scanner{baseUrl, transport, credentials};
        CHECK(scanner.authenticated());

        scanner.listScans();

        auto requests = transport->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests.at(0).authorization.isEmpty());
        CHECK(requests.at(1).authorization ==
              QByteArrayLiteral("Basic ZG94aWU6c2VjcmV0"));
    }

    SECTION("missing credential fails construction without scan calls") {
        REQUIRE_THROWS_AS(Scanner(baseUrl, transport, credentials),
                          CredentialNotFound);

        CHECK(transport->requests().size() == 1);
        CHECK(transport->count(QStringLiteral("/scans.json")) == 0);
    }

    SECTION("rejected credential") {
        credentials.passwords.insert(QStringLiteral("00:11:E5:06:2B:08"),
                                     QStringLiteral("wrong"));
        transport->route(QStringLiteral("/scans.json"), {}, 401);

        Scanner scanner{baseUrl, transport, credentials};

        CHECK_THROWS_AS(scanner.listScans(), DeviceAuthError);
    }
}

TEST_CASE("Scan listing", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    MapCredentials credentials;
    transport->route(QStringLiteral("/hello.json"), helloJson());
    transport->route(
        QStringLiteral("/scans.json"),
        R"([{"name":"/DOXIE/JPEG/IMG_0001.JPG","size":241803,"modified":"2010-05-01 00:10:22"},
            {"name":"/DOXIE/JPEG/IMG_0002.JPG"}])");

    Scanner scanner{baseUrl, transport, credentials};

    SECTION("records keep device order and metadata") {
        auto scans = scanner.listScans();

        REQUIRE(scans.size() == 2);
        CHECK(scans.at(0).name == QStringLiteral("/DOXIE/JPEG/IMG_0001.JPG"));
        CHECK(scans.at(0).baseName() == QStringLiteral("IMG_0001.JPG"));
        REQUIRE(scans.at(0).size.has_value());
        CHECK(*scans.at(0).size == 241803);
        CHECK(scans.at(0).modified == QStringLiteral("2010-05-01 00:10:22"));
        CHECK(scans.at(1).name == QStringLiteral("/DOXIE/JPEG/IMG_0002.JPG"));
        CHECK_FALSE(scans.at(1).size.has_value());
    }

    SECTION("listing is never cached") {
        scanner.listScans();
        scanner.listScans();

        CHECK(transport->count(QStringLiteral("/scans.json")) == 2);
    }

    SECTION("empty listing") {
        transport->route(QStringLiteral("/scans.json"), {});
        CHECK(scanner.listScans().empty());

        transport->route(QStringLiteral("/scans.json"), "[]");
        CHECK(scanner.listScans().empty());
    }

    SECTION("malformed listing") {
        transport->route(QStringLiteral("/scans.json"), R"({"name":"x"})");
        CHECK_THROWS_AS(scanner.listScans(), DeviceProtocolError);

        transport->route(QStringLiteral("/scans.json"), R"([{"size":1}])");
        CHECK_THROWS_AS(scanner.listScans(), DeviceProtocolError);
    }
}

TEST_CASE("Scan download", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    MapCredentials credentials;
    transport->route(QStringLiteral("/hello.json"), helloJson());

    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    Scanner scanner{baseUrl, transport, credentials};
    Scanner::Scan scan{QStringLiteral("/DOXIE/JPEG/IMG_0001.JPG"), {}, {}};

    const auto image = QByteArray::fromRawData("\xff\xd8\xff\xe0\x00\x10JFIF\x00"
                                               "\x01\x02\x00\x00\xff\xd9",
                                               17);

    SECTION("overwrites existing file with device bytes") {
        auto target = dir.filePath(QStringLiteral("IMG_0001.JPG"));
        {
            QFile old{target};
            REQUIRE(old.open(QIODevice::WriteOnly));
            old.write(QByteArray(1024, 'x'));
        }

        transport->route(QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG"),
                         image);

        auto path = scanner.downloadScan(scan, dir.path());

        CHECK(QFileInfo{path}.absoluteFilePath() ==
              QFileInfo{target}.absoluteFilePath());
        CHECK(readFile(path) == image);
    }

    SECTION("creates destination dir") {
        transport->route(QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG"),
                         image);

        auto path = scanner.downloadScan(
            scan, dir.filePath(QStringLiteral("nested/out")));

        CHECK(readFile(path) == image);
    }

    SECTION("saved under the given file name") {
        transport->route(QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG"),
                         image);

        auto path = scanner.downloadScan(scan, dir.path(),
                                         QStringLiteral("Office_IMG_0001.JPG"));

        CHECK(QFileInfo{path}.fileName() ==
              QStringLiteral("Office_IMG_0001.JPG"));
        CHECK(readFile(path) == image);
        CHECK_FALSE(QFile::exists(dir.filePath(QStringLiteral("IMG_0001.JPG"))));
    }

    SECTION("output dir that cannot be created") {
        auto blocker = dir.filePath(QStringLiteral("blocker"));
        {
            QFile file{blocker};
            REQUIRE(file.open(QIODevice::WriteOnly));
        }

        transport->route(QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG"),
                         image);

        CHECK_THROWS_WITH(
            scanner.downloadScan(scan, blocker + QStringLiteral("/out")),
            ContainsSubstring("cannot create output dir: " +
                              blocker.toStdString()));
        CHECK(transport->count(
                  QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG")) == 0);
    }

    SECTION("missing file is unavailable and leaves nothing behind") {
        try {
            scanner.downloadScan(scan, dir.path());
            FAIL("download did not throw");
        } catch (const ScanUnavailable &err) {
            CHECK(err.name() == scan.name);
            CHECK(err.status() == 404);
        }

        CHECK(QDir{dir.path()}.isEmpty());
    }

    SECTION("failed download keeps previous file") {
        auto target = dir.filePath(QStringLiteral("IMG_0001.JPG"));
        {
            QFile old{target};
            REQUIRE(old.open(QIODevice::WriteOnly));
            old.write("previous");
        }

        transport->route(QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG"), {},
                         500);

        CHECK_THROWS_AS(scanner.downloadScan(scan, dir.path()),
                        ScanUnavailable);
        CHECK(readFile(target) == QByteArrayLiteral("previous"));
    }

    SECTION("connection failure is not a missing scan") {
        transport->drop(QStringLiteral("/scans/DOXIE/JPEG/IMG_0001.JPG"));

        CHECK_THROWS_AS(scanner.downloadScan(scan, dir.path()),
                        DeviceUnreachable);
    }
}

TEST_CASE("Scan deletion", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    MapCredentials credentials;
    transport->route(QStringLiteral("/hello.json"), helloJson());
    transport->route(QStringLiteral("/scans/delete.json"), {}, 204);

    Scanner scanner{baseUrl, transport, credentials};
    const QStringList names{QStringLiteral("/DOXIE/JPEG/IMG_0001.JPG"),
                            QStringLiteral("/DOXIE/JPEG/IMG_0002.JPG")};

    SECTION("one request names every scan") {
        scanner.deleteScans(names);

        auto requests = transport->requests();
        REQUIRE(requests.size() == 2);
        const auto &request = requests.back();
        CHECK(request.verb == QByteArrayLiteral("POST"));
        CHECK(request.url.path() == QStringLiteral("/scans/delete.json"));

        auto body = QJsonDocument::fromJson(request.body);
        REQUIRE(body.isArray());
        CHECK(body.array().toVariantList().size() == 2);
        CHECK(body.array().at(0).toString() == names.at(0));
        CHECK(body.array().at(1).toString() == names.at(1));
    }

    SECTION("already deleted scans do not raise") {
        transport->route(QStringLiteral("/scans/delete.json"), {}, 404);

        CHECK_NOTHROW(scanner.deleteScans(names));
        CHECK_NOTHROW(scanner.deleteScans(names));
    }

    SECTION("empty list sends nothing") {
        scanner.deleteScans({});

        CHECK(transport->count(QStringLiteral("/scans/delete.json")) == 0);
    }

    SECTION("rejected request") {
        transport->route(QStringLiteral("/scans/delete.json"), {}, 500);
        CHECK_THROWS_AS(scanner.deleteScans(names), DeviceProtocolError);

        transport->drop(QStringLiteral("/scans/delete.json"));
        CHECK_THROWS_AS(scanner.deleteScans(names), DeviceUnreachable);
    }
}

TEST_CASE("Network restart", "[scanner]") {
    auto transport = std::make_shared<FakeTransport>();
    MapCredentials credentials;
    transport->route(QStringLiteral("/hello.json"), helloJson());

    Scanner scanner{baseUrl, transport, credentials};

    SECTION("dropped connection is expected") {
        transport->drop(QStringLiteral("/restart.json"));

        CHECK_NOTHROW(scanner.restartNetwork());
        CHECK(transport->count(QStringLiteral("/restart.json")) == 1);
    }

    SECTION("rejected credential is reported") {
        transport->route(QStringLiteral("/restart.json"), {}, 401);

        CHECK_THROWS_AS(scanner.restartNetwork(), DeviceAuthError);
    }
}

TEST_CASE("Scanners for different devices run in parallel", "[scanner]") {
    auto transportA = std::make_shared<FakeTransport>();
    auto transportB = std::make_shared<FakeTransport>();
    MapCredentials credentials;

    for (auto &transport : {transportA, transportB}) {
        transport->route(QStringLiteral("/hello.json"), helloJson());
        transport->route(QStringLiteral("/scans.json"), "[]");
    }

    Scanner scannerA{baseUrl, transportA, credentials};
    Scanner scannerB{QUrl{QStringLiteral("http://192.168.1.31:8080/")},
                     transportB, credentials};

    std::promise<void> aInside;
    std::promise<void> bDone;
    auto bDoneFuture = bDone.get_future().share();
    auto waitResult = std::future_status::timeout;

    // A stays inside its listing call until B has finished its own
    transportA->onRequest = [&](const Transport::Request &request) {
        if (request.url.path() != QStringLiteral("/scans.json")) return;
        aInside.set_value();
        waitResult = bDoneFuture.wait_for(std::chrono::seconds{5});
    };

    std::thread threadA{[&] { scannerA.listScans(); }};
    aInside.get_future().wait();

    std::thread threadB{[&] {
        scannerB.listScans();
        bDone.set_value();
    }};

    threadB.join();
    threadA.join();

    CHECK(waitResult == std::future_status::ready);
}
