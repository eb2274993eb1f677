#pragma once

#include <string>

/**
 * Extract the file name from a Content-Disposition header value.
 * Prefers the RFC 5987 form (filename*=UTF-8''my%20model.safetensors)
 * over the plain filename= parameter.
 *
 * @return decoded name, or empty string if the header carries none
 */
std::string filenameFromContentDisposition(const std::string &headerValue);

/**
 * Percent-decoded last segment of a URL's path ("" for "/").
 */
std::string lastPathSegment(const std::string &url);

/**
 * Make a server-supplied name safe to create inside the destination:
 * base name only, reserved and control characters replaced by '_'.
 * Falls back to civitai_download_<unix-seconds> when nothing usable remains.
 */
std::string sanitizeFilename(const std::string &name);
