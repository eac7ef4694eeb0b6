#include "identity_service.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "handler_support.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe.hpp"

namespace cloudsim::service {

using namespace cloudsim::v1;
using cloudsim::graph::RelationshipKind;
using cloudsim::graph::ResourceID;

namespace {

constexpr std::size_t kMaxAccessKeysPerUser  = 2;
constexpr int         kMaxRolesPerProfile    = 1;
constexpr const char* kGroupMembersKeyPrefix = "iam:group-members:";
constexpr const char* kProfileKeyPrefix      = "iam:instance-profile:";

struct AttachmentPrefix {
  const char* key_prefix;
  const char* type;
};

constexpr AttachmentPrefix kAttachmentPrefixes[] = {
    {"iam:user-policies:", "user"},
    {"iam:group-policies:", "group"},
    {"iam:role-policies:", "role"},
};

ResourceID IamId(std::string type, std::string id) {
  return ResourceID{"iam", std::move(type), std::move(id)};
}

std::string UserKey(const std::string& name) {
  return "iam:user:" + name;
}
std::string AccessKeyPrefix(const std::string& user) {
  return "iam:access-key:" + user + ":";
}
std::string GroupKey(const std::string& name) {
  return "iam:group:" + name;
}
std::string GroupMembersKey(const std::string& name) {
  return kGroupMembersKeyPrefix + name;
}
std::string RoleKey(const std::string& name) {
  return "iam:role:" + name;
}
std::string PolicyKey(const std::string& name) {
  return std::string("iam:policy:") + IdentityService::kAccountId + ":" + name;
}
std::string InstanceProfileKey(const std::string& name) {
  return kProfileKeyPrefix + name;
}

std::string Arn(const std::string& type, const std::string& path, const std::string& name) {
  return std::string("arn:aws:iam::") + IdentityService::kAccountId + ":" + type + path + name;
}

void ValidateName(const char* what, const std::string& name) {
  if (name.empty()) {
    throw util::InvalidArgument(std::string(what) + " name is required");
  }
}

std::string NormalizePath(const std::string& path) {
  if (path.empty()) return "/";
  if (path.front() != '/' || path.back() != '/') {
    throw util::InvalidArgument("path must begin and end with '/': " + path);
  }
  return path;
}

// "arn:aws:iam::<account>:policy/<path>/<name>" -> "<name>"
std::string PolicyNameFromArn(const std::string& arn) {
  const auto marker = arn.find(":policy/");
  if (arn.rfind("arn:aws:iam::", 0) != 0 || marker == std::string::npos) {
    throw util::InvalidArgument("invalid policy ARN: " + arn);
  }
  const auto name = arn.substr(arn.find_last_of('/') + 1);
  if (name.empty()) {
    throw util::InvalidArgument("invalid policy ARN: " + arn);
  }
  return name;
}

std::string SuffixAfter(const std::string& key, const std::string& prefix) {
  return key.substr(prefix.size());
}

// Stores a new record; a taken key throws util::AlreadyExists(taken).
template <typename Record>
void InsertNew(state::StateStore& store, const std::string& key, const Record& record, const std::string& taken) {
  const auto result = state::InsertRecord(store, key, record);
  if (result.code == state::ErrorCode::AlreadyExists) {
    throw util::AlreadyExists(taken);
  }
  ThrowIfStateError(result, "store " + key);
}

} // namespace

IdentityService::IdentityService(ServiceContext ctx) : ctx_(std::move(ctx)), graph_(ctx_.resources) {
  if (!ctx_.state) {
    throw std::invalid_argument("IdentityService: state store is required");
  }
}

// ---------------------------------------------------------------------
// Users
// ---------------------------------------------------------------------

UserRecord IdentityService::CreateUser(const std::string& name, const std::string& path) {
  return ObserveOperation("iam.CreateUser", [&] {
    ValidateName("user", name);
    const auto normalized = NormalizePath(path);

    const auto key = UserKey(name);

    UserRecord user;
    user.set_name(name);
    user.set_path(normalized);
    user.set_arn(Arn("user", normalized, name));
    user.set_user_id(util::GenerateUniqueId("AIDA"));
    user.set_created_at_ms(util::NowUnixMillis());
    InsertNew(*ctx_.state, key, user, "User with name " + name + " already exists.");

    graph_.Register(IamId("user", name), {{"arn", user.arn()}, {"path", normalized}}, [&] { UndoDelete(*ctx_.state, key); });
    return user;
  });
}

UserRecord IdentityService::GetUser(const std::string& name) const {
  return Require<UserRecord>(*ctx_.state, UserKey(name), "The user with name " + name + " cannot be found.");
}

void IdentityService::DeleteUser(const std::string& name) {
  ObserveOperation("iam.DeleteUser", [&] {
    Require<UserRecord>(*ctx_.state, UserKey(name), "The user with name " + name + " cannot be found.");

    const auto user_id = IamId("user", name);

    // Access keys and group memberships block the user in the provider's
    // model even though the membership edge points away from it.
    std::vector<ResourceID> blockers;
    const auto              key_prefix = AccessKeyPrefix(name);
    for (const auto& key : ctx_.state->List(key_prefix)) {
      blockers.push_back(IamId("access-key", SuffixAfter(key, key_prefix)));
    }
    for (const auto& key : ctx_.state->List(kGroupMembersKeyPrefix)) {
      auto members = state::GetRecord<GroupMembership>(*ctx_.state, key);
      if (members && Contains(members->user_names(), name)) {
        blockers.push_back(IamId("group", SuffixAfter(key, kGroupMembersKeyPrefix)));
      }
    }
    if (!blockers.empty()) {
      throw util::DependencyViolation(user_id, std::move(blockers));
    }

    // Attached policies are tracked as graph edges.
    graph_.Unregister(user_id);

    ThrowIfStateError(ctx_.state->Delete(UserKey(name)), "delete user");
    ReleaseAttachments(Principal::kUser, name);
  });
}

// ---------------------------------------------------------------------
// Access keys
// ---------------------------------------------------------------------

AccessKeyRecord IdentityService::CreateAccessKey(const std::string& user_name) {
  return ObserveOperation("iam.CreateAccessKey", [&] {
    ValidateName("user", user_name);
    Require<UserRecord>(*ctx_.state, UserKey(user_name), "The user with name " + user_name + " cannot be found.");

    if (ctx_.state->List(AccessKeyPrefix(user_name)).size() >= kMaxAccessKeysPerUser) {
      throw util::LimitExceeded("Cannot exceed quota for AccessKeysPerUser: " + std::to_string(kMaxAccessKeysPerUser));
    }

    AccessKeyRecord access_key;
    access_key.set_access_key_id(util::GenerateUniqueId("AKIA"));
    access_key.set_user_name(user_name);
    access_key.set_status("Active");
    access_key.set_created_at_ms(util::NowUnixMillis());

    const auto key = AccessKeyPrefix(user_name) + access_key.access_key_id();
    InsertNew(*ctx_.state, key, access_key, "Access key " + access_key.access_key_id() + " already exists.");

    const auto key_id = IamId("access-key", access_key.access_key_id());
    graph_.Register(key_id, {{"userName", user_name}}, [&] { UndoDelete(*ctx_.state, key); });
    graph_.Relate(IamId("user", user_name), key_id, RelationshipKind::kContains, [&] {
      UndoRegister(graph_.Tracker(), key_id);
      UndoDelete(*ctx_.state, key);
    });
    return access_key;
  });
}

std::vector<AccessKeyRecord> IdentityService::ListAccessKeys(const std::string& user_name) const {
  Require<UserRecord>(*ctx_.state, UserKey(user_name), "The user with name " + user_name + " cannot be found.");

  std::vector<AccessKeyRecord> keys;
  for (const auto& key : ctx_.state->List(AccessKeyPrefix(user_name))) {
    if (auto record = state::GetRecord<AccessKeyRecord>(*ctx_.state, key)) {
      keys.push_back(std::move(*record));
    }
  }
  return keys;
}

void IdentityService::DeleteAccessKey(const std::string& user_name, const std::string& access_key_id) {
  ObserveOperation("iam.DeleteAccessKey", [&] {
    const auto key = AccessKeyPrefix(user_name) + access_key_id;
    Require<AccessKeyRecord>(*ctx_.state, key, "The Access Key with id " + access_key_id + " cannot be found.");

    graph_.Unregister(IamId("access-key", access_key_id));
    ThrowIfStateError(ctx_.state->Delete(key), "delete access key");
  });
}

// ---------------------------------------------------------------------
// Groups
// ---------------------------------------------------------------------

GroupRecord IdentityService::CreateGroup(const std::string& name, const std::string& path) {
  return ObserveOperation("iam.CreateGroup", [&] {
    ValidateName("group", name);
    const auto normalized = NormalizePath(path);

    const auto key = GroupKey(name);

    GroupRecord group;
    group.set_name(name);
    group.set_path(normalized);
    group.set_arn(Arn("group", normalized, name));
    group.set_group_id(util::GenerateUniqueId("AGPA"));
    group.set_created_at_ms(util::NowUnixMillis());
    InsertNew(*ctx_.state, key, group, "Group with name " + name + " already exists.");

    graph_.Register(IamId("group", name), {{"arn", group.arn()}, {"path", normalized}}, [&] { UndoDelete(*ctx_.state, key); });
    return group;
  });
}

void IdentityService::DeleteGroup(const std::string& name) {
  ObserveOperation("iam.DeleteGroup", [&] {
    Require<GroupRecord>(*ctx_.state, GroupKey(name), "The group with name " + name + " cannot be found.");

    // Members and attached policies both point at the group.
    graph_.Unregister(IamId("group", name));

    ThrowIfStateError(ctx_.state->Delete(GroupKey(name)), "delete group");
    DeleteIfPresent(*ctx_.state, GroupMembersKey(name));
    ReleaseAttachments(Principal::kGroup, name);
  });
}

void IdentityService::AddUserToGroup(const std::string& group_name, const std::string& user_name) {
  ObserveOperation("iam.AddUserToGroup", [&] {
    Require<GroupRecord>(*ctx_.state, GroupKey(group_name), "The group with name " + group_name + " cannot be found.");
    Require<UserRecord>(*ctx_.state, UserKey(user_name), "The user with name " + user_name + " cannot be found.");

    const auto key    = GroupMembersKey(group_name);
    bool       added  = false;
    const auto add_to = [&](GroupMembership& members) {
      if (!Contains(members.user_names(), user_name)) {
        members.add_user_names(user_name);
        added = true;
      }
      return state::Result::Ok();
    };
    ThrowIfStateError(state::UpsertRecord<GroupMembership>(*ctx_.state, key, add_to), "store group membership");
    if (!added) {
      return;
    }

    graph_.Relate(IamId("user", user_name), IamId("group", group_name), RelationshipKind::kAssociatedWith, [&] {
      UndoUpdate<GroupMembership>(*ctx_.state, key, [&](GroupMembership& members) { Erase(members.mutable_user_names(), user_name); });
    });
  });
}

void IdentityService::RemoveUserFromGroup(const std::string& group_name, const std::string& user_name) {
  ObserveOperation("iam.RemoveUserFromGroup", [&] {
    const auto key = GroupMembersKey(group_name);
    Require<GroupRecord>(*ctx_.state, GroupKey(group_name), "The group with name " + group_name + " cannot be found.");

    bool       removed = false;
    const auto result  = state::UpdateRecord<GroupMembership>(*ctx_.state, key, [&](GroupMembership& members) {
      removed = Erase(members.mutable_user_names(), user_name);
      return state::Result::Ok();
    });
    if (result.code != state::ErrorCode::NotFound) {
      ThrowIfStateError(result, "store group membership");
    }
    if (!removed) {
      throw util::NotFound("User " + user_name + " is not a member of group " + group_name + ".");
    }

    graph_.Unrelate(IamId("user", user_name), IamId("group", group_name), RelationshipKind::kAssociatedWith);
  });
}

std::vector<std::string> IdentityService::ListGroupMembers(const std::string& group_name) const {
  Require<GroupRecord>(*ctx_.state, GroupKey(group_name), "The group with name " + group_name + " cannot be found.");

  const auto members = state::GetRecord<GroupMembership>(*ctx_.state, GroupMembersKey(group_name)).value_or(GroupMembership{});
  return std::vector<std::string>(members.user_names().begin(), members.user_names().end());
}

// ---------------------------------------------------------------------
// Roles
// ---------------------------------------------------------------------

RoleRecord IdentityService::CreateRole(const std::string& name, const std::string& assume_role_policy_document, const std::string& path) {
  return ObserveOperation("iam.CreateRole", [&] {
    ValidateName("role", name);
    if (assume_role_policy_document.empty()) {
      throw util::InvalidArgument("AssumeRolePolicyDocument is required");
    }
    const auto normalized = NormalizePath(path);

    const auto key = RoleKey(name);

    RoleRecord role;
    role.set_name(name);
    role.set_path(normalized);
    role.set_arn(Arn("role", normalized, name));
    role.set_role_id(util::GenerateUniqueId("AROA"));
    role.set_assume_role_policy_document(assume_role_policy_document);
    role.set_created_at_ms(util::NowUnixMillis());
    InsertNew(*ctx_.state, key, role, "Role with name " + name + " already exists.");

    graph_.Register(IamId("role", name), {{"arn", role.arn()}, {"path", normalized}}, [&] { UndoDelete(*ctx_.state, key); });
    return role;
  });
}

RoleRecord IdentityService::GetRole(const std::string& name) const {
  return Require<RoleRecord>(*ctx_.state, RoleKey(name), "The role with name " + name + " cannot be found.");
}

void IdentityService::DeleteRole(const std::string& name) {
  ObserveOperation("iam.DeleteRole", [&] {
    Require<RoleRecord>(*ctx_.state, RoleKey(name), "The role with name " + name + " cannot be found.");

    const auto role_id = IamId("role", name);

    // A profile's Contains edge blocks the profile, not the role; the
    // provider still refuses to delete a role mounted in a profile.
    std::vector<ResourceID> blockers;
    for (const auto& key : ctx_.state->List(kProfileKeyPrefix)) {
      auto profile = state::GetRecord<InstanceProfileRecord>(*ctx_.state, key);
      if (profile && Contains(profile->role_names(), name)) {
        blockers.push_back(IamId("instance-profile", profile->name()));
      }
    }
    if (!blockers.empty()) {
      throw util::DependencyViolation(role_id, std::move(blockers));
    }

    graph_.Unregister(role_id);

    ThrowIfStateError(ctx_.state->Delete(RoleKey(name)), "delete role");
    ReleaseAttachments(Principal::kRole, name);
  });
}

// ---------------------------------------------------------------------
// Managed policies
// ---------------------------------------------------------------------

PolicyRecord IdentityService::CreatePolicy(const std::string& name, const std::string& document, const std::string& path) {
  return ObserveOperation("iam.CreatePolicy", [&] {
    ValidateName("policy", name);
    if (document.empty()) {
      throw util::InvalidArgument("PolicyDocument is required");
    }
    google::protobuf::Struct parsed;
    if (!google::protobuf::util::JsonStringToMessage(document, &parsed).ok()) {
      throw util::InvalidArgument("PolicyDocument is not valid JSON");
    }
    const auto normalized = NormalizePath(path);

    const auto key = PolicyKey(name);

    PolicyRecord policy;
    policy.set_name(name);
    policy.set_path(normalized);
    policy.set_arn(Arn("policy", normalized, name));
    policy.set_policy_id(util::GenerateUniqueId("ANPA"));
    policy.set_document(document);
    policy.set_attachment_count(0);
    policy.set_created_at_ms(util::NowUnixMillis());
    InsertNew(*ctx_.state, key, policy, "A policy called " + name + " already exists.");

    graph_.Register(IamId("policy", name), {{"arn", policy.arn()}, {"path", normalized}}, [&] { UndoDelete(*ctx_.state, key); });
    return policy;
  });
}

PolicyRecord IdentityService::GetPolicy(const std::string& policy_arn) const {
  return Require<PolicyRecord>(*ctx_.state, PolicyKey(PolicyNameFromArn(policy_arn)), "Policy " + policy_arn + " does not exist.");
}

void IdentityService::DeletePolicy(const std::string& policy_arn) {
  ObserveOperation("iam.DeletePolicy", [&] {
    const auto name   = PolicyNameFromArn(policy_arn);
    const auto policy = Require<PolicyRecord>(*ctx_.state, PolicyKey(name), "Policy " + policy_arn + " does not exist.");

    // Attachment edges point from the policy to its principals and block
    // them, not the policy. The provider refuses to delete an attached
    // policy, so the attachment lists are consulted directly.
    if (policy.attachment_count() > 0) {
      std::vector<ResourceID> blockers;
      for (const auto& attachment : kAttachmentPrefixes) {
        const std::string key_prefix = attachment.key_prefix;
        for (const auto& key : ctx_.state->List(key_prefix)) {
          auto attachments = state::GetRecord<AttachmentList>(*ctx_.state, key);
          if (attachments && Contains(attachments->policy_arns(), policy_arn)) {
            blockers.push_back(IamId(attachment.type, SuffixAfter(key, key_prefix)));
          }
        }
      }
      if (!blockers.empty()) {
        throw util::DependencyViolation(IamId("policy", name), std::move(blockers));
      }
    }

    graph_.Unregister(IamId("policy", name));
    ThrowIfStateError(ctx_.state->Delete(PolicyKey(name)), "delete policy");
  });
}

// ---------------------------------------------------------------------
// Policy attachments
// ---------------------------------------------------------------------

const char* IdentityService::PrincipalType(Principal principal) {
  switch (principal) {
    case Principal::kUser:
      return "user";
    case Principal::kGroup:
      return "group";
    case Principal::kRole:
      return "role";
  }
  return "unknown";
}

void IdentityService::AttachUserPolicy(const std::string& user_name, const std::string& policy_arn) {
  ObserveOperation("iam.AttachUserPolicy", [&] { AttachPolicy(Principal::kUser, user_name, policy_arn); });
}

void IdentityService::DetachUserPolicy(const std::string& user_name, const std::string& policy_arn) {
  ObserveOperation("iam.DetachUserPolicy", [&] { DetachPolicy(Principal::kUser, user_name, policy_arn); });
}

void IdentityService::AttachGroupPolicy(const std::string& group_name, const std::string& policy_arn) {
  ObserveOperation("iam.AttachGroupPolicy", [&] { AttachPolicy(Principal::kGroup, group_name, policy_arn); });
}

void IdentityService::DetachGroupPolicy(const std::string& group_name, const std::string& policy_arn) {
  ObserveOperation("iam.DetachGroupPolicy", [&] { DetachPolicy(Principal::kGroup, group_name, policy_arn); });
}

void IdentityService::AttachRolePolicy(const std::string& role_name, const std::string& policy_arn) {
  ObserveOperation("iam.AttachRolePolicy", [&] { AttachPolicy(Principal::kRole, role_name, policy_arn); });
}

void IdentityService::DetachRolePolicy(const std::string& role_name, const std::string& policy_arn) {
  ObserveOperation("iam.DetachRolePolicy", [&] { DetachPolicy(Principal::kRole, role_name, policy_arn); });
}

std::vector<std::string> IdentityService::ListAttachedUserPolicies(const std::string& user_name) const {
  return AttachedPolicies(Principal::kUser, user_name);
}

std::vector<std::string> IdentityService::ListAttachedGroupPolicies(const std::string& group_name) const {
  return AttachedPolicies(Principal::kGroup, group_name);
}

std::vector<std::string> IdentityService::ListAttachedRolePolicies(const std::string& role_name) const {
  return AttachedPolicies(Principal::kRole, role_name);
}

void IdentityService::AttachPolicy(Principal principal, const std::string& name, const std::string& policy_arn) {
  const std::string type = PrincipalType(principal);

  if (!ctx_.state->Exists("iam:" + type + ":" + name)) {
    throw util::NotFound("The " + type + " with name " + name + " cannot be found.");
  }
  const auto policy_name = PolicyNameFromArn(policy_arn);
  Require<PolicyRecord>(*ctx_.state, PolicyKey(policy_name), "Policy " + policy_arn + " does not exist or is not attachable.");

  const auto key    = "iam:" + type + "-policies:" + name;
  bool       added  = false;
  const auto add_to = [&](AttachmentList& attachments) {
    if (!Contains(attachments.policy_arns(), policy_arn)) {
      attachments.add_policy_arns(policy_arn);
      added = true;
    }
    return state::Result::Ok();
  };
  ThrowIfStateError(state::UpsertRecord<AttachmentList>(*ctx_.state, key, add_to), "store attachments");
  if (!added) {
    return;
  }

  graph_.Relate(IamId("policy", policy_name), IamId(type, name), RelationshipKind::kAssociatedWith, [&] {
    UndoUpdate<AttachmentList>(*ctx_.state, key, [&](AttachmentList& attachments) { Erase(attachments.mutable_policy_arns(), policy_arn); });
  });

  AdjustAttachmentCount(policy_name, +1);
}

void IdentityService::DetachPolicy(Principal principal, const std::string& name, const std::string& policy_arn) {
  const std::string type = PrincipalType(principal);

  if (!ctx_.state->Exists("iam:" + type + ":" + name)) {
    throw util::NotFound("The " + type + " with name " + name + " cannot be found.");
  }
  const auto policy_name = PolicyNameFromArn(policy_arn);

  const auto key     = "iam:" + type + "-policies:" + name;
  bool       removed = false;
  const auto result  = state::UpdateRecord<AttachmentList>(*ctx_.state, key, [&](AttachmentList& attachments) {
    removed = Erase(attachments.mutable_policy_arns(), policy_arn);
    return state::Result::Ok();
  });
  if (result.code != state::ErrorCode::NotFound) {
    ThrowIfStateError(result, "store attachments");
  }
  if (!removed) {
    throw util::NotFound("Policy " + policy_arn + " was not found attached to " + type + " " + name + ".");
  }

  graph_.Unrelate(IamId("policy", policy_name), IamId(type, name), RelationshipKind::kAssociatedWith);

  AdjustAttachmentCount(policy_name, -1);
}

std::vector<std::string> IdentityService::AttachedPolicies(Principal principal, const std::string& name) const {
  const std::string type = PrincipalType(principal);

  if (!ctx_.state->Exists("iam:" + type + ":" + name)) {
    throw util::NotFound("The " + type + " with name " + name + " cannot be found.");
  }
  const auto attachments = state::GetRecord<AttachmentList>(*ctx_.state, "iam:" + type + "-policies:" + name).value_or(AttachmentList{});
  return std::vector<std::string>(attachments.policy_arns().begin(), attachments.policy_arns().end());
}

void IdentityService::ReleaseAttachments(Principal principal, const std::string& name) {
  const auto key         = "iam:" + std::string(PrincipalType(principal)) + "-policies:" + name;
  const auto attachments = state::GetRecord<AttachmentList>(*ctx_.state, key);
  if (!attachments) return;

  for (const auto& policy_arn : attachments->policy_arns()) {
    const auto policy_name = PolicyNameFromArn(policy_arn);
    if (ctx_.state->Exists(PolicyKey(policy_name))) {
      AdjustAttachmentCount(policy_name, -1);
    }
  }
  DeleteIfPresent(*ctx_.state, key);
}

void IdentityService::AdjustAttachmentCount(const std::string& policy_name, int delta) {
  const auto result = state::UpdateRecord<PolicyRecord>(*ctx_.state, PolicyKey(policy_name), [delta](PolicyRecord& policy) {
    const auto current = static_cast<int>(policy.attachment_count());
    policy.set_attachment_count(static_cast<uint32_t>(std::max(0, current + delta)));
    return state::Result::Ok();
  });
  ThrowIfStateError(result, "update attachment count for " + policy_name);
}

// ---------------------------------------------------------------------
// Instance profiles
// ---------------------------------------------------------------------

InstanceProfileRecord IdentityService::CreateInstanceProfile(const std::string& name, const std::string& path) {
  return ObserveOperation("iam.CreateInstanceProfile", [&] {
    ValidateName("instance profile", name);
    const auto normalized = NormalizePath(path);

    const auto key = InstanceProfileKey(name);

    InstanceProfileRecord profile;
    profile.set_name(name);
    profile.set_path(normalized);
    profile.set_arn(Arn("instance-profile", normalized, name));
    profile.set_profile_id(util::GenerateUniqueId("AIPA"));
    profile.set_created_at_ms(util::NowUnixMillis());
    InsertNew(*ctx_.state, key, profile, "Instance Profile " + name + " already exists.");

    graph_.Register(IamId("instance-profile", name), {{"arn", profile.arn()}, {"path", normalized}}, [&] { UndoDelete(*ctx_.state, key); });
    return profile;
  });
}

InstanceProfileRecord IdentityService::GetInstanceProfile(const std::string& name) const {
  return Require<InstanceProfileRecord>(*ctx_.state, InstanceProfileKey(name), "Instance profile " + name + " cannot be found.");
}

void IdentityService::DeleteInstanceProfile(const std::string& name) {
  ObserveOperation("iam.DeleteInstanceProfile", [&] {
    Require<InstanceProfileRecord>(*ctx_.state, InstanceProfileKey(name), "Instance profile " + name + " cannot be found.");

    // A mounted role is a Contains edge and blocks the profile.
    graph_.Unregister(IamId("instance-profile", name));

    ThrowIfStateError(ctx_.state->Delete(InstanceProfileKey(name)), "delete instance profile");
  });
}

void IdentityService::AddRoleToInstanceProfile(const std::string& profile_name, const std::string& role_name) {
  ObserveOperation("iam.AddRoleToInstanceProfile", [&] {
    Require<RoleRecord>(*ctx_.state, RoleKey(role_name), "The role with name " + role_name + " cannot be found.");

    const auto key        = InstanceProfileKey(profile_name);
    bool       added      = false;
    bool       over_quota = false;
    const auto result     = state::UpdateRecord<InstanceProfileRecord>(*ctx_.state, key, [&](InstanceProfileRecord& profile) {
      if (Contains(profile.role_names(), role_name)) {
        return state::Result::Ok();
      }
      if (profile.role_names_size() >= kMaxRolesPerProfile) {
        over_quota = true;
        return state::Result::Err(state::ErrorCode::Conflict, "profile is full");
      }
      profile.add_role_names(role_name);
      added = true;
      return state::Result::Ok();
    });
    if (result.code == state::ErrorCode::NotFound) {
      throw util::NotFound("Instance profile " + profile_name + " cannot be found.");
    }
    if (over_quota) {
      throw util::LimitExceeded("Cannot exceed quota for RolesPerInstanceProfile: " + std::to_string(kMaxRolesPerProfile));
    }
    ThrowIfStateError(result, "store instance profile");
    if (!added) {
      return;
    }

    graph_.Relate(IamId("instance-profile", profile_name), IamId("role", role_name), RelationshipKind::kContains, [&] {
      UndoUpdate<InstanceProfileRecord>(*ctx_.state, key, [&](InstanceProfileRecord& profile) { Erase(profile.mutable_role_names(), role_name); });
    });
  });
}

void IdentityService::RemoveRoleFromInstanceProfile(const std::string& profile_name, const std::string& role_name) {
  ObserveOperation("iam.RemoveRoleFromInstanceProfile", [&] {
    const auto key     = InstanceProfileKey(profile_name);
    bool       removed = false;
    const auto result  = state::UpdateRecord<InstanceProfileRecord>(*ctx_.state, key, [&](InstanceProfileRecord& profile) {
      removed = Erase(profile.mutable_role_names(), role_name);
      return state::Result::Ok();
    });
    if (result.code == state::ErrorCode::NotFound) {
      throw util::NotFound("Instance profile " + profile_name + " cannot be found.");
    }
    ThrowIfStateError(result, "store instance profile");
    if (!removed) {
      throw util::NotFound("Role " + role_name + " is not in instance profile " + profile_name + ".");
    }

    graph_.Unrelate(IamId("instance-profile", profile_name), IamId("role", role_name), RelationshipKind::kContains);
  });
}

} // namespace cloudsim::service
