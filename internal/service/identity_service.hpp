#pragma once

#include <string>
#include <vector>

#include "cloudsim/v1.hpp"
#include "resource_bookkeeping.hpp"
#include "service_context.hpp"

namespace cloudsim::service {

/*
  Emulated identity service: users, access keys, groups, roles, managed
  policies and instance profiles.

  Graph edges maintained here:
    user             -Contains->       access-key
    user             -AssociatedWith-> group
    policy           -AssociatedWith-> user | group | role
    instance-profile -Contains->       role

  Errors are thrown as util exceptions; see ToApiError().
*/
class IdentityService {
 public:
  static constexpr const char* kAccountId = "123456789012";

  explicit IdentityService(ServiceContext ctx);

  cloudsim::v1::UserRecord CreateUser(const std::string& name, const std::string& path = "/");
  cloudsim::v1::UserRecord GetUser(const std::string& name) const;
  void                     DeleteUser(const std::string& name);

  cloudsim::v1::AccessKeyRecord              CreateAccessKey(const std::string& user_name);
  std::vector<cloudsim::v1::AccessKeyRecord> ListAccessKeys(const std::string& user_name) const;
  void                                       DeleteAccessKey(const std::string& user_name, const std::string& access_key_id);

  cloudsim::v1::GroupRecord CreateGroup(const std::string& name, const std::string& path = "/");
  void                      DeleteGroup(const std::string& name);
  void                      AddUserToGroup(const std::string& group_name, const std::string& user_name);
  void                      RemoveUserFromGroup(const std::string& group_name, const std::string& user_name);
  std::vector<std::string>  ListGroupMembers(const std::string& group_name) const;

  cloudsim::v1::RoleRecord CreateRole(const std::string& name, const std::string& assume_role_policy_document, const std::string& path = "/");
  cloudsim::v1::RoleRecord GetRole(const std::string& name) const;
  void                     DeleteRole(const std::string& name);

  cloudsim::v1::PolicyRecord CreatePolicy(const std::string& name, const std::string& document, const std::string& path = "/");
  cloudsim::v1::PolicyRecord GetPolicy(const std::string& policy_arn) const;
  void                       DeletePolicy(const std::string& policy_arn);

  void AttachUserPolicy(const std::string& user_name, const std::string& policy_arn);
  void DetachUserPolicy(const std::string& user_name, const std::string& policy_arn);
  void AttachGroupPolicy(const std::string& group_name, const std::string& policy_arn);
  void DetachGroupPolicy(const std::string& group_name, const std::string& policy_arn);
  void AttachRolePolicy(const std::string& role_name, const std::string& policy_arn);
  void DetachRolePolicy(const std::string& role_name, const std::string& policy_arn);

  std::vector<std::string> ListAttachedUserPolicies(const std::string& user_name) const;
  std::vector<std::string> ListAttachedGroupPolicies(const std::string& group_name) const;
  std::vector<std::string> ListAttachedRolePolicies(const std::string& role_name) const;

  cloudsim::v1::InstanceProfileRecord CreateInstanceProfile(const std::string& name, const std::string& path = "/");
  cloudsim::v1::InstanceProfileRecord GetInstanceProfile(const std::string& name) const;
  void                                DeleteInstanceProfile(const std::string& name);
  void                                AddRoleToInstanceProfile(const std::string& profile_name, const std::string& role_name);
  void                                RemoveRoleFromInstanceProfile(const std::string& profile_name, const std::string& role_name);

 private:
  enum class Principal { kUser, kGroup, kRole };

  static const char* PrincipalType(Principal principal);

  void AttachPolicy(Principal principal, const std::string& name, const std::string& policy_arn);
  void DetachPolicy(Principal principal, const std::string& name, const std::string& policy_arn);

  std::vector<std::string> AttachedPolicies(Principal principal, const std::string& name) const;

  // Drops the principal's attachment list and the policies' counts with it.
  void ReleaseAttachments(Principal principal, const std::string& name);

  void AdjustAttachmentCount(const std::string& policy_name, int delta);

  ServiceContext      ctx_;
  ResourceBookkeeping graph_;
};

} // namespace cloudsim::service
