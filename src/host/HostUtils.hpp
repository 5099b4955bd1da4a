#ifndef __EB_HOST_UTILS__
#define __EB_HOST_UTILS__

#include "ComposeTypes.hpp"

namespace eb {
/**
 * @brief Compares major and minor versions.  Versions that do not have
 * exactly three dot-separated segments are never compatible.
 */
bool isVersionCompatible(const string& hostVersion,
                         const string& callerVersion);

/**
 * @brief `editor_bridge_<tab id>.eml` inside the requested temporary
 * directory, or inside the system one when none was given.
 */
string getTemporaryDocumentPath(const Compose& compose);

/** @brief Appends a hint pointing at the document left on disk. */
string withRecoveryHint(const string& message, const string& path);

/** @brief Substitutes the document path into the editor command template. */
string buildEditorCommand(const string& commandTemplate, const string& path);
}  // namespace eb

#endif  // __EB_HOST_UTILS__
