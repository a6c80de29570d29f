#include "s3.policies.hh"

#include <nlohmann/json.hpp>
#include <tinyxml2.h>

std::string
chunkstore::public_read_policy(std::string_view bucket)
{
    const std::string arn = "arn:aws:s3:::" + std::string(bucket);

    nlohmann::json statement = {
        { "Sid", "PublicRead" },
        { "Effect", "Allow" },
        { "Principal", { { "AWS", { "*" } } } },
        { "Action", { "s3:GetObject", "s3:ListBucket" } },
        { "Resource", { arn + "/*", arn } },
    };

    nlohmann::json policy = {
        { "Version", "2012-10-17" },
        { "Id", "PublicAccess" },
        { "Statement", nlohmann::json::array({ statement }) },
    };

    return policy.dump();
}

std::string
chunkstore::expiry_lifecycle(unsigned int days)
{
    tinyxml2::XMLDocument doc;
    auto* config = doc.NewElement("LifecycleConfiguration");
    doc.InsertEndChild(config);

    auto* rule = config->InsertNewChildElement("Rule");
    rule->InsertNewChildElement("ID")->SetText(
      ("chunkstore_expiry_" + std::to_string(days) + "_days").c_str());
    rule->InsertNewChildElement("Filter");
    rule->InsertNewChildElement("Status")->SetText("Enabled");
    rule->InsertNewChildElement("Expiration")
      ->InsertNewChildElement("Days")
      ->SetText(days);

    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    return printer.CStr();
}
