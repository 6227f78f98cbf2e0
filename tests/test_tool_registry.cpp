#include <QTest>
#include "core/mcp/JsonRpc.hpp"
#include "core/mcp/ToolRegistry.hpp"

namespace {

QString firstText(const notch::ToolResult& r)
{
    return r.result.value("content").toArray().at(0).toObject().value("text").toString();
}

} // namespace

class TestToolRegistry : public QObject {
    Q_OBJECT
private slots:
    void testRegisterAndCall()
    {
        notch::ToolRegistry registry;
        QJsonObject seen;
        registry.registerTool("echo", "Echo the message", QJsonObject{{"type", "object"}},
                              [&](const QJsonObject& args) {
                                  seen = args;
                                  return notch::ToolResult::text(args.value("message").toString());
                              });

        notch::ToolResult r = registry.call("echo", QJsonObject{{"message", "hi"}});
        QVERIFY(!r.isProtocolError());
        QCOMPARE(firstText(r), QString("hi"));
        QCOMPARE(seen.value("message").toString(), QString("hi"));
        QVERIFY(!r.result.contains("isError"));
    }

    void testCallUnknownTool()
    {
        notch::ToolRegistry registry;
        notch::ToolResult r = registry.call("nonexistent", {});
        QVERIFY(r.isProtocolError());
        QCOMPARE(r.errorCode, notch::jsonrpc::kInvalidParams);
        QCOMPARE(r.errorMessage, QString("Unknown tool: nonexistent"));
    }

    void testToolLevelError()
    {
        notch::ToolResult r = notch::ToolResult::text("Error: socket missing", true);
        QVERIFY(!r.isProtocolError());
        QCOMPARE(r.result.value("isError").toBool(), true);
        QCOMPARE(r.result.value("content").toArray().at(0).toObject().value("type").toString(),
                 QString("text"));
    }

    void testToolListSortedWithSchemas()
    {
        notch::ToolRegistry registry;
        QJsonObject schema{{"type", "object"}, {"required", QJsonArray{"title"}}};
        registry.registerTool("show_result", "Show a result", schema,
                              [](const QJsonObject&) { return notch::ToolResult::text(""); });
        registry.registerTool("ask_confirmation", "Ask", {},
                              [](const QJsonObject&) { return notch::ToolResult::text(""); });

        QJsonArray list = registry.toolList();
        QCOMPARE(list.size(), 2);
        QCOMPARE(list.at(0).toObject().value("name").toString(), QString("ask_confirmation"));

        QJsonObject second = list.at(1).toObject();
        QCOMPARE(second.value("name").toString(), QString("show_result"));
        QCOMPARE(second.value("description").toString(), QString("Show a result"));
        QCOMPARE(second.value("inputSchema").toObject(), schema);
    }

    void testDuplicateRegistrationOverwrites()
    {
        notch::ToolRegistry registry;
        registry.registerTool("test", "v1", {}, [](const QJsonObject&) { return notch::ToolResult::text("1"); });
        registry.registerTool("test", "v2", {}, [](const QJsonObject&) { return notch::ToolResult::text("2"); });

        QCOMPARE(firstText(registry.call("test", {})), QString("2"));  // last-write-wins
        QCOMPARE(registry.toolList().size(), 1);
        QCOMPARE(registry.toolList().at(0).toObject().value("description").toString(), QString("v2"));
    }
};

QTEST_MAIN(TestToolRegistry)
#include "test_tool_registry.moc"
