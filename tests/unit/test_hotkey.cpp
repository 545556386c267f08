/**
 * @file test_hotkey.cpp
 * @brief Unit tests for hotkey string parsing
 */

#include <QTest>

#include "hotkey.h"

class TestHotkey : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void defaultHotkey()
    {
        const auto hotkey = hotkey::parse("ctrl+shift+t");
        QVERIFY(hotkey.has_value());
        QCOMPARE(hotkey->key, ui::KeyCode::T);
        QVERIFY(ui::has_modifier(hotkey->modifiers, ui::KeyModifier::Ctrl));
        QVERIFY(ui::has_modifier(hotkey->modifiers, ui::KeyModifier::Shift));
        QVERIFY(!ui::has_modifier(hotkey->modifiers, ui::KeyModifier::Alt));
        QVERIFY(!ui::has_modifier(hotkey->modifiers, ui::KeyModifier::Super));
    }

    void caseAndWhitespace_areIgnored()
    {
        const auto hotkey = hotkey::parse("  Control + ALT +f5 ");
        QVERIFY(hotkey.has_value());
        QCOMPARE(hotkey->key, ui::KeyCode::F5);
        QCOMPARE(hotkey->modifiers,
                 ui::KeyModifier::Ctrl | ui::KeyModifier::Alt);
    }

    void keys_data()
    {
        QTest::addColumn<QString>("text");
        QTest::addColumn<int>("key");

        QTest::newRow("letter") << "super+n" << int(ui::KeyCode::N);
        QTest::newRow("digit") << "alt+7" << int(ui::KeyCode::Num7);
        QTest::newRow("f12") << "f12" << int(ui::KeyCode::F12);
        QTest::newRow("space") << "ctrl+space" << int(ui::KeyCode::Space);
        QTest::newRow("enter alias") << "ctrl+enter" << int(ui::KeyCode::Return);
        QTest::newRow("esc alias") << "shift+esc" << int(ui::KeyCode::Escape);
        QTest::newRow("win alias") << "win+tab" << int(ui::KeyCode::Tab);
    }

    void keys()
    {
        QFETCH(QString, text);
        QFETCH(int, key);

        const auto hotkey = hotkey::parse(text.toStdString());
        QVERIFY(hotkey.has_value());
        QCOMPARE(int(hotkey->key), key);
    }

    void invalid_data()
    {
        QTest::addColumn<QString>("text");

        QTest::newRow("empty") << "";
        QTest::newRow("blank") << "   ";
        QTest::newRow("modifiers only") << "ctrl+shift";
        QTest::newRow("two keys") << "ctrl+a+b";
        QTest::newRow("unknown key") << "ctrl+pageup";
        QTest::newRow("f13") << "ctrl+f13";
        QTest::newRow("f0") << "f0";
        QTest::newRow("trailing plus") << "ctrl+";
        QTest::newRow("double plus") << "ctrl++t";
        QTest::newRow("punctuation") << "ctrl+;";
    }

    void invalid()
    {
        QFETCH(QString, text);
        QVERIFY(!hotkey::parse(text.toStdString()).has_value());
    }

    void toString_isCanonical()
    {
        const auto hotkey = hotkey::parse("Shift+Super+Ctrl+Alt+F1");
        QVERIFY(hotkey.has_value());
        QCOMPARE(hotkey::to_string(*hotkey),
                 std::string("ctrl+alt+shift+super+f1"));

        const auto plain = hotkey::parse("ctrl+shift+t");
        QCOMPARE(hotkey::to_string(*plain), std::string("ctrl+shift+t"));
    }
};

QTEST_GUILESS_MAIN(TestHotkey)
#include "test_hotkey.moc"
