/**
 * @file test_config.cpp
 * @brief Unit tests for INI parsing, defaults and validation of Config
 */

#include <QTemporaryDir>
#include <QTest>

#include "config.h"

#include <fstream>
#include <sstream>

namespace
{

Config parse_text(const std::string &text)
{
    std::istringstream input(text);
    return Config::parse(parse_ini(input));
}

} // anonymous namespace

class TestConfig : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void defaults()
    {
        const Config config = parse_text("");

        QCOMPARE(config.hotkey, std::string("ctrl+shift+t"));
        QCOMPARE(config.window_opacity, 0.9);
        QCOMPARE(config.font.family, std::string("Sans"));
        QCOMPARE(config.font.size, 16);
        QVERIFY(!config.default_position.has_value());
        QCOMPARE(config.placement_margin, 20);
        QCOMPARE(config.placement_gap, 10);
        QCOMPARE(config.log_level, LogLevel::INFO);
    }

    void parseIni_skipsCommentsAndTrims()
    {
        std::istringstream input("# comment\n"
                                 "\n"
                                 "  hotkey =  alt+F5  \n"
                                 "no equals sign\n"
                                 "font.family=DejaVu Sans\r\n");
        const auto values = parse_ini(input);

        QCOMPARE(values.size(), size_t(2));
        QCOMPARE(values.find("hotkey")->second, std::string("alt+F5"));
        QCOMPARE(values.find("font.family")->second, std::string("DejaVu Sans"));
    }

    void lastValueWins()
    {
        const Config config = parse_text("placement.gap=4\nplacement.gap=12\n");
        QCOMPARE(config.placement_gap, 12);
    }

    void fullConfiguration()
    {
        const Config config = parse_text("hotkey=super+n\n"
                                         "window_opacity=0.5\n"
                                         "font.family=Mono\n"
                                         "font.size=11\n"
                                         "default_position.x=100\n"
                                         "default_position.y=200\n"
                                         "placement.margin=0\n"
                                         "placement.gap=3\n"
                                         "log_level=DEBUG\n");

        QCOMPARE(config.hotkey, std::string("super+n"));
        QCOMPARE(config.window_opacity, 0.5);
        QCOMPARE(config.font.family, std::string("Mono"));
        QCOMPARE(config.font.size, 11);
        QVERIFY(config.default_position.has_value());
        QCOMPARE(config.default_position->x, 100);
        QCOMPARE(config.default_position->y, 200);
        QCOMPARE(config.placement_margin, 0);
        QCOMPARE(config.placement_gap, 3);
        QCOMPARE(config.log_level, LogLevel::DEBUG);
    }

    void opacity_isClamped_data()
    {
        QTest::addColumn<QString>("value");
        QTest::addColumn<double>("expected");

        QTest::newRow("above one") << QStringLiteral("1.7") << 1.0;
        QTest::newRow("zero") << QStringLiteral("0") << 0.1;
        QTest::newRow("negative") << QStringLiteral("-0.3") << 0.1;
        QTest::newRow("exactly one") << QStringLiteral("1") << 1.0;
        QTest::newRow("garbage") << QStringLiteral("opaque") << 0.9;
    }

    void opacity_isClamped()
    {
        QFETCH(QString, value);
        QFETCH(double, expected);

        const Config config =
            parse_text("window_opacity=" + value.toStdString() + "\n");
        QCOMPARE(config.window_opacity, expected);
    }

    void invalidNumbers_keepDefaults()
    {
        const Config config = parse_text("font.size=-4\n"
                                         "placement.gap=-10\n"
                                         "placement.margin=wide\n"
                                         "log_level=chatty\n");

        QCOMPARE(config.font.size, 16);
        QCOMPARE(config.placement_gap, 0);
        QCOMPARE(config.placement_margin, 20);
        QCOMPARE(config.log_level, LogLevel::INFO);
    }

    void partialDefaultPosition_isIgnored()
    {
        const Config config = parse_text("default_position.x=100\n");
        QVERIFY(!config.default_position.has_value());
    }

    void load_createsDefaultFile()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const fs::path path =
            fs::path(dir.path().toStdString()) / "nested" / "config.ini";

        const Config config = Config::load(path);

        QVERIFY(fs::exists(path));
        QCOMPARE(config.config_path, path);
        QCOMPARE(config.hotkey, std::string(DEFAULT_HOTKEY));
    }

    void saveThenLoad_keepsValues()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const fs::path path = fs::path(dir.path().toStdString()) / "config.ini";

        Config original;
        original.hotkey = "ctrl+alt+n";
        original.default_position = ui::ScreenCoord{40, 60};
        original.placement_gap = 7;
        original.log_level = LogLevel::WARNING;
        original.save(path);

        const Config loaded = Config::load(path);
        QCOMPARE(loaded.hotkey, original.hotkey);
        QVERIFY(loaded.default_position.has_value());
        QCOMPARE(loaded.default_position->x, 40);
        QCOMPARE(loaded.default_position->y, 60);
        QCOMPARE(loaded.placement_gap, 7);
        QCOMPARE(loaded.log_level, LogLevel::WARNING);
    }

    void scaleFont_followsArea()
    {
        const FontConfig font;
        const ui::WindowDimension base{.height = 60, .width = 240};

        QCOMPARE(scale_font(font, base, base).size, 16);
        QCOMPARE(scale_font(font, base, base).family, font.family);

        // Four times the area: 16 * 4^0.3
        const auto larger =
            scale_font(font, base, ui::WindowDimension{.height = 120, .width = 480});
        QCOMPARE(larger.size, 24);

        const auto smaller =
            scale_font(font, base, ui::WindowDimension{.height = 50, .width = 200});
        QVERIFY(smaller.size < 16);
        QVERIFY(smaller.size >= 10);
    }

    void scaleFont_staysInRange()
    {
        const FontConfig font;
        const ui::WindowDimension base{.height = 60, .width = 240};

        QCOMPARE(scale_font(font, base,
                            ui::WindowDimension{.height = 2000, .width = 4000})
                     .size,
                 32);
        QCOMPARE(scale_font(font, base, ui::WindowDimension{.height = 1, .width = 1})
                     .size,
                 10);

        // A configured size outside the range is kept at the base area
        FontConfig huge;
        huge.size = 40;
        QCOMPARE(scale_font(huge, base, base).size, 40);

        // No base to scale from
        QCOMPARE(scale_font(font, ui::WindowDimension{.height = 0, .width = 0},
                            base)
                     .size,
                 16);
    }
};

QTEST_GUILESS_MAIN(TestConfig)
#include "test_config.moc"
