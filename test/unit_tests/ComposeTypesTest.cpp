#include "ComposeFixtures.hpp"
#include "ComposeTypes.hpp"
#include "TestHeaders.hpp"

using namespace eb;

namespace {
json requestJson() {
  return json::parse(R"({
    "configuration": {
      "version": "0.0.0",
      "sequence": 0,
      "total": 1,
      "shell": "sh",
      "template": "nvim \"/path/to/temp.eml\"",
      "temporaryDirectory": "/tmp",
      "sendOnExit": true,
      "suppressHelpHeaders": false,
      "metaHeaders": true,
      "allowCustomHeaders": false,
      "bypassVersionCheck": false
    },
    "warnings": [],
    "tab": {"id": 7, "windowId": 2, "type": "messageCompose"},
    "composeDetails": {
      "from": "someone@example.com",
      "to": ["a@example.com", {"id": "n1", "type": "contact"}],
      "cc": "b@example.com",
      "bcc": [],
      "subject": "Hi",
      "isPlainText": true,
      "plainTextBody": "Hello",
      "priority": "High",
      "deliveryFormat": null,
      "attachVCard": false,
      "identityId": "id1",
      "attachments": [{"name": "a.txt"}],
      "customHeaders": [{"name": "x-foo", "value": "bar"}]
    }
  })");
}
}  // namespace

TEST_CASE("Compose requests are decoded", "[ComposeTypes]") {
  Compose compose = Compose::fromJson(requestJson());
  REQUIRE(compose.tabId() == 7);
  REQUIRE(compose.configuration.shell == "sh");
  REQUIRE(compose.configuration.commandTemplate ==
          "nvim \"/path/to/temp.eml\"");
  REQUIRE(compose.configuration.sendOnExit);
  REQUIRE(compose.configuration.metaHeaders);

  const auto& details = compose.composeDetails;
  REQUIRE(details.from == Recipient::email("someone@example.com"));
  REQUIRE(details.to.kind == RecipientList::Kind::MULTIPLE);
  REQUIRE(details.to.recipients.size() == 2);
  REQUIRE(details.to.recipients[1].kind == Recipient::Kind::NODE);
  REQUIRE(details.to.recipients[1].node.id == "n1");
  REQUIRE(details.cc.kind == RecipientList::Kind::SINGLE);
  REQUIRE(details.bcc.recipients.empty());
  REQUIRE(details.replyTo.recipients.empty());
  REQUIRE(details.priority == Priority::HIGH);
  REQUIRE(details.deliveryFormat.state ==
          DeliveryFormatOverride::State::DEFAULT);
  REQUIRE(details.attachVCard.value == false);
  REQUIRE_FALSE(details.attachVCard.touched);
  REQUIRE_FALSE(details.returnReceipt);
  REQUIRE(details.customHeaders.size() == 1);
  REQUIRE(details.customHeaders[0] == CustomHeader("X-foo", "bar"));
  REQUIRE(details.extra.size() == 2);
  REQUIRE(details.extra["identityId"] == "id1");
}

TEST_CASE("Compose responses keep the wire shape", "[ComposeTypes]") {
  json j = Compose::fromJson(requestJson()).toJson();
  const json& details = j["composeDetails"];

  SECTION("Recipient lists") {
    REQUIRE(details["to"] ==
            json::parse(R"(["a@example.com", {"id": "n1", "type": "contact"}])"));
    REQUIRE(details["cc"] == "b@example.com");
    REQUIRE(details["bcc"] == json::array());
    REQUIRE(details["replyTo"] == json::array());
  }

  SECTION("Optional fields") {
    REQUIRE(details["priority"] == "high");
    REQUIRE(details.contains("deliveryFormat"));
    REQUIRE(details["deliveryFormat"].is_null());
    REQUIRE(details["attachVCard"] == false);
    REQUIRE_FALSE(details.contains("returnReceipt"));
    REQUIRE_FALSE(details.contains("body"));
    REQUIRE(details["plainTextBody"] == "Hello");
    REQUIRE(details["customHeaders"] ==
            json::parse(R"([{"name": "X-foo", "value": "bar"}])"));
  }

  SECTION("Unknown keys pass through") {
    REQUIRE(details["identityId"] == "id1");
    REQUIRE(details["attachments"][0]["name"] == "a.txt");
    REQUIRE(j["tab"]["windowId"] == 2);
  }

  SECTION("Local settings stay local") {
    REQUIRE_FALSE(j["configuration"].contains("shell"));
    REQUIRE_FALSE(j["configuration"].contains("template"));
    REQUIRE(j["configuration"]["temporaryDirectory"] == "/tmp");
  }
}

TEST_CASE("Delivery format states", "[ComposeTypes]") {
  json j = requestJson();

  j["composeDetails"].erase("deliveryFormat");
  Compose compose = Compose::fromJson(j);
  REQUIRE(compose.composeDetails.deliveryFormat.state ==
          DeliveryFormatOverride::State::ABSENT);
  REQUIRE_FALSE(compose.toJson()["composeDetails"].contains("deliveryFormat"));

  j["composeDetails"]["deliveryFormat"] = "html";
  compose = Compose::fromJson(j);
  REQUIRE(compose.composeDetails.deliveryFormat.value == DeliveryFormat::HTML);
  REQUIRE(compose.toJson()["composeDetails"]["deliveryFormat"] == "html");

  j["composeDetails"]["deliveryFormat"] = "rich";
  REQUIRE_THROWS_AS(Compose::fromJson(j), std::runtime_error);
}

TEST_CASE("Malformed requests are rejected", "[ComposeTypes]") {
  json j = requestJson();

  SECTION("Missing sender") {
    j["composeDetails"].erase("from");
    REQUIRE_THROWS(Compose::fromJson(j));
  }

  SECTION("Unknown recipient type") {
    j["composeDetails"]["to"] = json::parse(R"({"id": "x", "type": "group"})");
    REQUIRE_THROWS(Compose::fromJson(j));
  }

  SECTION("Unknown priority") {
    j["composeDetails"]["priority"] = "urgent";
    REQUIRE_THROWS(Compose::fromJson(j));
  }

  SECTION("Missing configuration") {
    j.erase("configuration");
    REQUIRE_THROWS(Compose::fromJson(j));
  }
}

TEST_CASE("Body selection follows isPlainText", "[ComposeTypes]") {
  ComposeDetails details;
  details.body = "<p>html</p>";
  details.plainTextBody = "plain";
  REQUIRE(details.getBody() == "<p>html</p>");
  details.isPlainText = true;
  REQUIRE(details.getBody() == "plain");

  details.setBody("edited");
  REQUIRE(details.plainTextBody == "edited");
  REQUIRE(details.body.empty());
}

TEST_CASE("Recipient lists", "[ComposeTypes]") {
  RecipientList list = RecipientList::single(Recipient::email("a@example.com"));
  REQUIRE(list.toJson() == "a@example.com");
  list.add(Recipient::email("b@example.com"));
  REQUIRE(list.kind == RecipientList::Kind::MULTIPLE);
  REQUIRE(list.toJson() == json({"a@example.com", "b@example.com"}));
  list.clear();
  REQUIRE(list.toJson() == json::array());
}

TEST_CASE("Pings and errors", "[ComposeTypes]") {
  REQUIRE(isPing(json::parse(R"({"ping": 1234})")));
  REQUIRE_FALSE(isPing(requestJson()));
  REQUIRE_FALSE(isPing(json::array()));

  ErrorResponse error;
  error.tab = makeBlankCompose().tab;
  error.reset = true;
  error.title = "Title";
  error.message = "Message";
  json j = error.toJson();
  REQUIRE(j["tab"]["id"] == 0);
  REQUIRE(j["reset"] == true);
  REQUIRE(j["title"] == "Title");
  REQUIRE(j["message"] == "Message");
}

TEST_CASE("Keyword tables", "[ComposeTypes]") {
  REQUIRE(priorityToString(Priority::LOWEST) == "lowest");
  REQUIRE(priorityFromString("HighEst") == Priority::HIGHEST);
  REQUIRE_FALSE(priorityFromString("urgent"));
  REQUIRE(deliveryFormatToString(DeliveryFormat::PLAIN_TEXT) == "plaintext");
  REQUIRE(deliveryFormatFromString("Both") == DeliveryFormat::BOTH);
  REQUIRE_FALSE(deliveryFormatFromString("plain"));
}
