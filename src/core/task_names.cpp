#include "agent_runner/core/task_names.hpp"

#include <algorithm>
#include <map>

namespace agent_runner::task_names {

const std::vector<std::string>& all() {
    static const std::vector<std::string> kAll = {
        kWebScraper, kScreenshot, kCompanyResearch, kCompetitor,
        kReviewSentiment, kSeo, kMessaging, kVisualDesign,
        kConversion, kSocial, kIcp, kReport};
    return kAll;
}

bool is_known(const std::string& name) {
    const auto& names = all();
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string display_name(const std::string& name) {
    static const std::map<std::string, std::string> kDisplay = {
        {kWebScraper, "Web Scraper"},
        {kScreenshot, "Visual Screenshot Capture"},
        {kCompanyResearch, "Company Research"},
        {kCompetitor, "Competitor Intelligence"},
        {kReviewSentiment, "Reviews & Sentiment"},
        {kSeo, "SEO & Visibility"},
        {kMessaging, "Messaging & Positioning"},
        {kVisualDesign, "Visual & Design"},
        {kConversion, "Conversion Optimization"},
        {kSocial, "Social & Engagement"},
        {kIcp, "ICP & Segmentation"},
        {kReport, "Report Generation"},
    };
    auto it = kDisplay.find(name);
    return it != kDisplay.end() ? it->second : name;
}

} // namespace agent_runner::task_names
