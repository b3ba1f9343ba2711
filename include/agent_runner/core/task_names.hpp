#pragma once

#include <string>
#include <vector>

namespace agent_runner::task_names {

inline constexpr const char* kWebScraper = "web_scraper";
inline constexpr const char* kScreenshot = "screenshot";
inline constexpr const char* kCompanyResearch = "company_research";
inline constexpr const char* kCompetitor = "competitor";
inline constexpr const char* kReviewSentiment = "review_sentiment";
inline constexpr const char* kSeo = "seo";
inline constexpr const char* kMessaging = "messaging";
inline constexpr const char* kVisualDesign = "visual_design";
inline constexpr const char* kConversion = "conversion";
inline constexpr const char* kSocial = "social";
inline constexpr const char* kIcp = "icp";
inline constexpr const char* kReport = "report";

// Canonical order (matches phase order)
const std::vector<std::string>& all();

bool is_known(const std::string& name);

// Human label, e.g. "seo" -> "SEO & Visibility"; unknown names map to themselves
std::string display_name(const std::string& name);

} // namespace agent_runner::task_names
