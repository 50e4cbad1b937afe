#include "lambda_function_service.hpp"

#include <map>
#include <type_traits>
#include <variant>

#include <aws/core/utils/Array.h>
#include <aws/core/utils/logging/LogMacros.h>
#include <aws/lambda/model/Architecture.h>
#include <aws/lambda/model/GetFunctionCodeSigningConfigRequest.h>
#include <aws/lambda/model/GetFunctionRequest.h>
#include <aws/lambda/model/PublishVersionRequest.h>
#include <aws/lambda/model/UpdateFunctionCodeRequest.h>

#include "constants.hpp"
#include "function/function_utils.hpp"
#include "function/lambda_requests.hpp"

namespace stratus {

namespace {

template <class AwsOutcomeClass>
ServiceError GetErrorFromOutcome(const AwsOutcomeClass& outcome, const std::string& call) {
  const auto& error = outcome.GetError();
  return {TranslateLambdaError(error.GetErrorType()),
          call + ": " + error.GetExceptionName() + ": " + error.GetMessage()};
}

}  // namespace

LambdaFunctionService::LambdaFunctionService(std::shared_ptr<const Aws::Lambda::LambdaClient> client)
    : client_(std::move(client)) {}

std::pair<RemoteFunctionState, ServiceError> LambdaFunctionService::GetFunction(const FunctionIdentity& identity) {
  const auto get_function_outcome =
      client_->GetFunction(Aws::Lambda::Model::GetFunctionRequest().WithFunctionName(identity.name));
  if (!get_function_outcome.IsSuccess()) {
    return {RemoteFunctionState{}, GetErrorFromOutcome(get_function_outcome, "GetFunction")};
  }

  const auto get_code_signing_config_outcome = client_->GetFunctionCodeSigningConfig(
      Aws::Lambda::Model::GetFunctionCodeSigningConfigRequest().WithFunctionName(identity.name));
  if (!get_code_signing_config_outcome.IsSuccess()) {
    return {RemoteFunctionState{},
            GetErrorFromOutcome(get_code_signing_config_outcome, "GetFunctionCodeSigningConfig")};
  }

  const auto& result = get_function_outcome.GetResult();
  const auto& configuration = result.GetConfiguration();
  const auto& concurrency = result.GetConcurrency();

  const std::map<std::string, std::string> tags(result.GetTags().cbegin(), result.GetTags().cend());
  const std::optional<int> reserved_concurrency =
      concurrency.ReservedConcurrentExecutionsHasBeenSet()
          ? std::optional<int>(concurrency.GetReservedConcurrentExecutions())
          : std::nullopt;

  RemoteFunctionState state;
  state.config = FunctionConfigFromRemote(configuration, tags, reserved_concurrency,
                                          get_code_signing_config_outcome.GetResult().GetCodeSigningConfigArn());
  state.revision_id = configuration.GetRevisionId();
  state.arn = configuration.GetFunctionArn();
  state.code_sha256 = configuration.GetCodeSha256();
  state.package_type = Aws::Lambda::Model::PackageTypeMapper::GetNameForPackageType(configuration.GetPackageType());
  state.last_update_status = TranslateFunctionStatus(configuration.GetState(), configuration.GetLastUpdateStatus());
  state.last_update_status_reason =
      configuration.GetLastUpdateStatusReason().empty() ? configuration.GetStateReason()
                                                        : configuration.GetLastUpdateStatusReason();

  return {state, ServiceError::Success()};
}

std::pair<MutationResult, ServiceError> LambdaFunctionService::CreateFunction(const FunctionIdentity& identity,
                                                                              const FunctionConfig& config,
                                                                              const CodeSource& code_source) {
  const auto requests = BuildCreateFunctionRequests(identity.name, config, code_source);

  const auto create_function_outcome = client_->CreateFunction(requests.create_function);
  if (!create_function_outcome.IsSuccess()) {
    return {MutationResult{}, GetErrorFromOutcome(create_function_outcome, "CreateFunction")};
  }

  MutationResult mutation_result{.arn = create_function_outcome.GetResult().GetFunctionArn(),
                                 .revision_id = create_function_outcome.GetResult().GetRevisionId()};

  if (requests.put_function_concurrency) {
    const auto put_function_concurrency_outcome = client_->PutFunctionConcurrency(*requests.put_function_concurrency);
    if (!put_function_concurrency_outcome.IsSuccess()) {
      AWS_LOGSTREAM_ERROR(kExecutorTag.c_str(), "Function '" << identity.name
                                                              << "' was created, but setting its reserved concurrency "
                                                                 "failed.");
      mutation_result.partially_applied = true;
      return {mutation_result, GetErrorFromOutcome(put_function_concurrency_outcome, "PutFunctionConcurrency")};
    }
  }

  return {mutation_result, ServiceError::Success()};
}

std::pair<MutationResult, ServiceError> LambdaFunctionService::UpdateFunctionCode(
    const FunctionIdentity& identity, const CodeSource& code_source, const std::optional<std::string>& architecture,
    const std::optional<std::string>& revision_id) {
  auto update_function_code_request =
      Aws::Lambda::Model::UpdateFunctionCodeRequest().WithFunctionName(identity.name).WithPublish(false);

  std::visit(
      [&update_function_code_request](const auto& code) {
        using T = std::decay_t<decltype(code)>;
        if constexpr (std::is_same_v<T, InlineCode>) {
          update_function_code_request.SetZipFile(
              Aws::Utils::CryptoBuffer(reinterpret_cast<const unsigned char*>(code.bytes->data()), code.bytes->size()));
        } else {
          static_assert(std::is_same_v<T, ObjectStoreCode>, "Unhandled code source type.");
          update_function_code_request.SetS3Bucket(code.bucket);
          update_function_code_request.SetS3Key(code.key);
        }
      },
      code_source);

  if (architecture) {
    update_function_code_request.SetArchitectures(Aws::Vector<Aws::Lambda::Model::Architecture>{
        Aws::Lambda::Model::ArchitectureMapper::GetArchitectureForName(*architecture)});
  }
  if (revision_id) {
    update_function_code_request.SetRevisionId(*revision_id);
  }

  const auto update_function_code_outcome = client_->UpdateFunctionCode(update_function_code_request);
  if (!update_function_code_outcome.IsSuccess()) {
    return {MutationResult{}, GetErrorFromOutcome(update_function_code_outcome, "UpdateFunctionCode")};
  }

  return {MutationResult{.arn = update_function_code_outcome.GetResult().GetFunctionArn(),
                         .revision_id = update_function_code_outcome.GetResult().GetRevisionId()},
          ServiceError::Success()};
}

std::pair<MutationResult, ServiceError> LambdaFunctionService::UpdateFunctionConfiguration(
    const FunctionIdentity& identity, const FunctionConfig& changes, const std::optional<std::string>& revision_id) {
  MutationResult mutation_result;
  std::map<std::string, std::string> current_tags;

  if (NeedsCurrentFunctionState(changes, revision_id)) {
    const auto get_function_outcome =
        client_->GetFunction(Aws::Lambda::Model::GetFunctionRequest().WithFunctionName(identity.name));
    if (!get_function_outcome.IsSuccess()) {
      return {MutationResult{}, GetErrorFromOutcome(get_function_outcome, "GetFunction")};
    }
    mutation_result.arn = get_function_outcome.GetResult().GetConfiguration().GetFunctionArn();
    mutation_result.revision_id = get_function_outcome.GetResult().GetConfiguration().GetRevisionId();
    current_tags = std::map<std::string, std::string>(get_function_outcome.GetResult().GetTags().cbegin(),
                                                      get_function_outcome.GetResult().GetTags().cend());
  }

  const auto requests = BuildConfigurationUpdateRequests(identity.name, mutation_result.arn, current_tags, changes,
                                                         revision_id);

  // Without an UpdateFunctionConfiguration call the service cannot enforce the revision. The revision is compared
  // right before the first call instead, which leaves a short window for a concurrent writer.
  if (requests.revision_id_to_check && *requests.revision_id_to_check != mutation_result.revision_id) {
    return {MutationResult{}, ServiceError(ServiceErrorType::kConflict,
                                           "GetFunction: the revision id " + *requests.revision_id_to_check +
                                               " does not match the latest revision " + mutation_result.revision_id)};
  }

  // Calls after the first successful one leave the function changed if they fail.
  bool applied = false;
  const auto fail = [&mutation_result, &applied](const ServiceError& error) {
    MutationResult partial_result = mutation_result;
    partial_result.partially_applied = applied;
    return std::pair<MutationResult, ServiceError>{partial_result, error};
  };

  if (requests.update_function_configuration) {
    const auto update_function_configuration_outcome =
        client_->UpdateFunctionConfiguration(*requests.update_function_configuration);
    if (!update_function_configuration_outcome.IsSuccess()) {
      return {MutationResult{},
              GetErrorFromOutcome(update_function_configuration_outcome, "UpdateFunctionConfiguration")};
    }
    mutation_result.arn = update_function_configuration_outcome.GetResult().GetFunctionArn();
    mutation_result.revision_id = update_function_configuration_outcome.GetResult().GetRevisionId();
    applied = true;
  }

  if (requests.untag_resource) {
    const auto untag_resource_outcome = client_->UntagResource(*requests.untag_resource);
    if (!untag_resource_outcome.IsSuccess()) {
      return fail(GetErrorFromOutcome(untag_resource_outcome, "UntagResource"));
    }
    applied = true;
  }

  if (requests.tag_resource) {
    const auto tag_resource_outcome = client_->TagResource(*requests.tag_resource);
    if (!tag_resource_outcome.IsSuccess()) {
      return fail(GetErrorFromOutcome(tag_resource_outcome, "TagResource"));
    }
    applied = true;
  }

  if (requests.put_function_concurrency) {
    const auto put_function_concurrency_outcome = client_->PutFunctionConcurrency(*requests.put_function_concurrency);
    if (!put_function_concurrency_outcome.IsSuccess()) {
      return fail(GetErrorFromOutcome(put_function_concurrency_outcome, "PutFunctionConcurrency"));
    }
    applied = true;
  }

  if (requests.put_function_code_signing_config) {
    const auto put_outcome = client_->PutFunctionCodeSigningConfig(*requests.put_function_code_signing_config);
    if (!put_outcome.IsSuccess()) {
      return fail(GetErrorFromOutcome(put_outcome, "PutFunctionCodeSigningConfig"));
    }
  }

  if (requests.delete_function_code_signing_config) {
    const auto delete_outcome =
        client_->DeleteFunctionCodeSigningConfig(*requests.delete_function_code_signing_config);
    if (!delete_outcome.IsSuccess()) {
      return fail(GetErrorFromOutcome(delete_outcome, "DeleteFunctionCodeSigningConfig"));
    }
  }

  return {mutation_result, ServiceError::Success()};
}

std::pair<std::string, ServiceError> LambdaFunctionService::PublishVersion(const FunctionIdentity& identity) {
  const auto publish_version_outcome =
      client_->PublishVersion(Aws::Lambda::Model::PublishVersionRequest().WithFunctionName(identity.name));
  if (!publish_version_outcome.IsSuccess()) {
    return {"", GetErrorFromOutcome(publish_version_outcome, "PublishVersion")};
  }

  return {publish_version_outcome.GetResult().GetVersion(), ServiceError::Success()};
}

}  // namespace stratus
