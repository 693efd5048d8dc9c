#include <QTest>
#include <QJsonArray>
#include "capability/result_shaper.h"

namespace {

QJsonObject pos(int line, int character) {
    return QJsonObject{{"line", line}, {"character", character}};
}

QJsonObject range(int l0, int c0, int l1, int c1) {
    return QJsonObject{{"start", pos(l0, c0)}, {"end", pos(l1, c1)}};
}

} // namespace

class TestResultShaper : public QObject {
    Q_OBJECT

private slots:
    void testHoverMarkupContent() {
        const QJsonValue shaped = ResultShaper::hover(QJsonObject{
            {"contents", QJsonObject{{"kind", "markdown"}, {"value", "```rust\nfn main()\n```"}}},
            {"range", range(0, 3, 0, 7)}});
        QVERIFY(shaped.isObject());
        QCOMPARE(shaped["kind"].toString(), QStringLiteral("markdown"));
        QVERIFY(shaped["value"].toString().contains(QStringLiteral("fn main()")));
        QCOMPARE(shaped["range"].toObject(), range(0, 3, 0, 7));
    }

    void testHoverMarkedStrings() {
        const QJsonValue shaped = ResultShaper::hover(QJsonObject{
            {"contents", QJsonArray{QJsonObject{{"language", "rust"}, {"value", "i32"}}, "a number"}}});
        QCOMPARE(shaped["value"].toString(), QStringLiteral("```rust\ni32\n```\n\na number"));
        QVERIFY(!shaped.toObject().contains(QStringLiteral("range")));
    }

    void testHoverEmptyIsNull() {
        QVERIFY(ResultShaper::hover(QJsonValue::Null).isNull());
        QVERIFY(ResultShaper::hover(QJsonObject{{"contents", ""}}).isNull());
    }

    void testLocationsAcceptAllShapes() {
        const QJsonObject single{{"uri", "file:///ws/a.rs"}, {"range", range(1, 0, 1, 4)}};
        QCOMPARE(ResultShaper::locations(single).size(), qsizetype(1));

        const QJsonArray links{QJsonObject{{"targetUri", "file:///ws/b.rs"},
                                           {"targetRange", range(0, 0, 9, 0)},
                                           {"targetSelectionRange", range(2, 3, 2, 8)}}};
        const QJsonArray shaped = ResultShaper::locations(links);
        QCOMPARE(shaped.size(), qsizetype(1));
        QCOMPARE(shaped[0]["path"].toString(), QStringLiteral("/ws/b.rs"));
        QCOMPARE(shaped[0]["range"].toObject(), range(2, 3, 2, 8));

        QVERIFY(ResultShaper::locations(QJsonValue::Null).isEmpty());
    }

    void testCompletionList() {
        const QJsonObject shaped = ResultShaper::completion(QJsonObject{
            {"isIncomplete", true},
            {"items", QJsonArray{
                QJsonObject{{"label", "push"}, {"kind", 2}, {"detail", "fn(&mut self, T)"},
                            {"documentation", QJsonObject{{"kind", "markdown"}, {"value", "Appends"}}},
                            {"textEdit", QJsonObject{{"range", range(0, 0, 0, 1)}, {"newText", "push($0)"}}}},
                QJsonObject{{"label", "len"}}}}});
        QVERIFY(shaped["is_incomplete"].toBool());
        const QJsonArray items = shaped["items"].toArray();
        QCOMPARE(items.size(), qsizetype(2));
        QCOMPARE(items[0]["kind"].toString(), QStringLiteral("method"));
        QCOMPARE(items[0]["documentation"].toString(), QStringLiteral("Appends"));
        QCOMPARE(items[0]["insert_text"].toString(), QStringLiteral("push($0)"));
        QCOMPARE(items[1]["kind"].toString(), QStringLiteral("unknown"));
        QCOMPARE(items[1]["insert_text"].toString(), QStringLiteral("len"));
    }

    void testCompletionBareArray() {
        const QJsonObject shaped = ResultShaper::completion(QJsonArray{QJsonObject{{"label", "x"}, {"kind", 6}}});
        QVERIFY(!shaped["is_incomplete"].toBool());
        QCOMPARE(shaped["items"].toArray().at(0)["kind"].toString(), QStringLiteral("variable"));
    }

    void testDocumentSymbolsHierarchical() {
        const QJsonArray shaped = ResultShaper::documentSymbols(QJsonArray{QJsonObject{
            {"name", "Point"}, {"kind", 23}, {"range", range(0, 0, 3, 1)}, {"selectionRange", range(0, 7, 0, 12)},
            {"children", QJsonArray{QJsonObject{{"name", "x"}, {"kind", 8},
                                                {"range", range(1, 4, 1, 10)}, {"selectionRange", range(1, 4, 1, 5)}}}}}});
        QCOMPARE(shaped.size(), qsizetype(1));
        QCOMPARE(shaped[0]["kind"].toString(), QStringLiteral("struct"));
        QCOMPARE(shaped[0]["children"].toArray().at(0)["kind"].toString(), QStringLiteral("field"));
    }

    void testDocumentSymbolsFlat() {
        const QJsonArray shaped = ResultShaper::documentSymbols(QJsonArray{QJsonObject{
            {"name", "main"}, {"kind", 12}, {"containerName", "crate"},
            {"location", QJsonObject{{"uri", "file:///a.rs"}, {"range", range(0, 0, 2, 1)}}}}});
        QCOMPARE(shaped[0]["kind"].toString(), QStringLiteral("function"));
        QCOMPARE(shaped[0]["container"].toString(), QStringLiteral("crate"));
        QCOMPARE(shaped[0]["selection_range"].toObject(), range(0, 0, 2, 1));
    }

    void testWorkspaceSymbols() {
        const QJsonArray shaped = ResultShaper::workspaceSymbols(QJsonArray{QJsonObject{
            {"name", "Config"}, {"kind", 23},
            {"location", QJsonObject{{"uri", "file:///ws/src/config.rs"}}}}});
        QCOMPARE(shaped[0]["path"].toString(), QStringLiteral("/ws/src/config.rs"));
        QVERIFY(shaped[0]["range"].isNull());
    }

    void testTextEdits() {
        const QJsonArray shaped = ResultShaper::textEdits(QJsonArray{
            QJsonObject{{"range", range(0, 0, 0, 3)}, {"newText", "let"}}});
        QCOMPARE(shaped[0]["new_text"].toString(), QStringLiteral("let"));
        QVERIFY(ResultShaper::textEdits(QJsonValue::Null).isEmpty());
    }

    void testCodeActionsAndCommands() {
        const QJsonArray shaped = ResultShaper::codeActions(QJsonArray{
            QJsonObject{{"title", "Import HashMap"}, {"kind", "quickfix"}, {"isPreferred", true},
                        {"diagnostics", QJsonArray{QJsonObject{{"range", range(0, 0, 0, 7)}, {"message", "unresolved"}}}},
                        {"edit", QJsonObject{{"changes", QJsonObject()}}}},
            QJsonObject{{"title", "Run test"}, {"command", "rust-analyzer.runSingle"}, {"arguments", QJsonArray{1}}}});
        QCOMPARE(shaped.size(), qsizetype(2));
        QVERIFY(shaped[0]["is_preferred"].toBool());
        QCOMPARE(shaped[0]["diagnostics"].toArray().at(0)["severity"].toString(), QStringLiteral("error"));
        QVERIFY(shaped[0].toObject().contains(QStringLiteral("edit")));
        QCOMPARE(shaped[1]["command"].toObject()["command"].toString(), QStringLiteral("rust-analyzer.runSingle"));
        QVERIFY(!shaped[1]["is_preferred"].toBool());
    }

    void testDiagnosticRelatedInformation() {
        const QJsonObject shaped = ResultShaper::diagnostic(QJsonObject{
            {"range", range(3, 4, 3, 9)}, {"severity", 2}, {"code", "E0308"}, {"source", "rustc"},
            {"message", "mismatched types"},
            {"relatedInformation", QJsonArray{QJsonObject{
                {"location", QJsonObject{{"uri", "file:///ws/a.rs"}, {"range", range(1, 0, 1, 3)}}},
                {"message", "expected due to this"}}}}});
        QCOMPARE(shaped["severity"].toString(), QStringLiteral("warning"));
        QCOMPARE(shaped["code"].toString(), QStringLiteral("E0308"));
        QCOMPARE(shaped["related"].toArray().at(0)["path"].toString(), QStringLiteral("/ws/a.rs"));
    }

    void testDiagnosticsReport() {
        const QJsonObject none = ResultShaper::diagnosticsReport(QStringLiteral("file:///ws/a.rs"), std::nullopt);
        QCOMPARE(none["source"].toString(), QStringLiteral("none"));
        QVERIFY(none["diagnostics"].toArray().isEmpty());

        DiagnosticsEntry entry;
        entry.uri = QStringLiteral("file:///ws/a.rs");
        entry.source = DiagnosticsSource::Pull;
        entry.resultId = QStringLiteral("r1");
        entry.receivedAt = QDateTime::currentDateTimeUtc();
        entry.items = QJsonArray{QJsonObject{{"range", range(0, 0, 0, 1)}, {"severity", 4}, {"message", "hint"}}};
        const QJsonObject report = ResultShaper::diagnosticsReport(entry.uri, entry);
        QCOMPARE(report["source"].toString(), QStringLiteral("pull"));
        QCOMPARE(report["result_id"].toString(), QStringLiteral("r1"));
        QCOMPARE(report["path"].toString(), QStringLiteral("/ws/a.rs"));
        QCOMPARE(report["diagnostics"].toArray().at(0)["severity"].toString(), QStringLiteral("hint"));
    }

    void testKindNames() {
        QCOMPARE(ResultShaper::symbolKindName(26), QStringLiteral("type_parameter"));
        QCOMPARE(ResultShaper::symbolKindName(0), QStringLiteral("unknown"));
        QCOMPARE(ResultShaper::completionKindName(25), QStringLiteral("type_parameter"));
        QCOMPARE(ResultShaper::severityName(3), QStringLiteral("information"));
    }
};

QTEST_MAIN(TestResultShaper)
#include "tst_result_shaper.moc"
