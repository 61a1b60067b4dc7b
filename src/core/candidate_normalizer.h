#pragma once
#include <string>
#include <vector>

// Turns whatever the user typed ("example.com", "www.shop.io/products?x=1",
// "http://Store.example") into the root URLs worth probing, best first.
//
// For host h and its www-counterpart w the order is
//   https://h/  http://h/  https://w/  http://w/
// with duplicates removed. Empty or unparseable input gives no candidates.
// No network access happens here.

/**
 * @brief Build the ordered candidate list for one detection run
 * @param raw User input, with or without scheme, path or query
 * @return Up to four distinct "scheme://host/" URLs
 */
std::vector<std::string> normalize_candidates(const std::string& raw);

/**
 * @brief Extract the lower-cased host (plus ":port" if present) from an absolute URL
 * @param url Absolute http(s) URL
 * @return host[:port], or empty string if the URL has no usable host
 */
std::string extract_host(const std::string& url);

/**
 * @brief Give the www-counterpart of a host
 * @param host Host without scheme
 * @return host with one leading "www." removed, or with "www." prepended
 */
std::string counterpart_host(const std::string& host);
