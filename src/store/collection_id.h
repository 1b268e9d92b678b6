/**
 * @file collection_id.h
 * @brief Registry of collections known to the application
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace talentvault::store {

/**
 * @brief Known collections
 *
 * The store may hold other collections too; snapshots cover every
 * collection it lists except the recovery catalog.
 */
enum class CollectionId : uint8_t {
  kUsers,
  kCandidates,
  kJobs,
  kClients,
  kInvoices,
  kEmployees,
  kPayroll,
  kAnalytics,
  kAuditLogs,
  kSessions,
  kSecurityEvents,
  kRecoveryPoints,
  kRecoveryData,
  kRecoverySequence,
};

struct CollectionInfo {
  CollectionId id;
  std::string_view name;
  bool catalog;  // Owned by the recovery catalog, never snapshotted
};

inline constexpr std::array<CollectionInfo, 14> kKnownCollections = {{
    {CollectionId::kUsers, "users", false},
    {CollectionId::kCandidates, "candidates", false},
    {CollectionId::kJobs, "jobs", false},
    {CollectionId::kClients, "clients", false},
    {CollectionId::kInvoices, "invoices", false},
    {CollectionId::kEmployees, "employees", false},
    {CollectionId::kPayroll, "payroll", false},
    {CollectionId::kAnalytics, "analytics", false},
    {CollectionId::kAuditLogs, "auditLogs", false},
    {CollectionId::kSessions, "sessions", false},
    {CollectionId::kSecurityEvents, "securityEvents", false},
    {CollectionId::kRecoveryPoints, "recoveryPoints", true},
    {CollectionId::kRecoveryData, "recoveryData", true},
    {CollectionId::kRecoverySequence, "recoverySequence", true},
}};

/**
 * @brief Collection name as stored
 */
std::string_view CollectionName(CollectionId id);

/**
 * @brief Look up a known collection by name (case-sensitive)
 */
std::optional<CollectionId> ParseCollectionId(std::string_view name);

/**
 * @brief True for collections owned by the recovery catalog
 */
bool IsCatalogCollection(std::string_view name);

}  // namespace talentvault::store
