#pragma once

#include <boost/system/error_code.hpp>
#include <sstream>
#include <string>

namespace lib {
    using boost::system::error_code;
    using boost::system::error_category;
}

#define IAM_EXPLORER_ERROR_CODE_ENUM_NAMESPACE_START namespace boost { namespace system {
#define IAM_EXPLORER_ERROR_CODE_ENUM_NAMESPACE_END }}

namespace iam_explorer {

class IamExplorerError : public lib::error_category
{
 public:
    enum ErrorCodes {
        ok,
        malformed_entity,
        inconsistent_snapshot,
        unknown_identity,
        invalid_pattern,
        invalid_format,
        cancelled
    };
    const char* name() const noexcept { return "iam_explorer"; }
    std::string message(int e) const {
        switch(e) {
            case ok: return "Ok";
            case malformed_entity: return "Malformed entity";
            case inconsistent_snapshot: return "Inconsistent snapshot";
            case unknown_identity: return "Unknown identity";
            case invalid_pattern: return "Invalid pattern";
            case invalid_format: return "Invalid format";
            case cancelled: return "Operation cancelled";
            default: {
                std::stringstream ss;
                ss << "unknown iam_explorer error " << e;
                return ss.str();
            }
        }
    }
};

class IamExplorerErrorCategoryContainer {
 public:
    static IamExplorerError& category() {
        static IamExplorerError category;
        return category;
    }
};

static inline lib::error_code make_error_code(IamExplorerError::ErrorCodes e) {
    return lib::error_code(static_cast<int>(e), IamExplorerErrorCategoryContainer::category());
}

} // namespace

IAM_EXPLORER_ERROR_CODE_ENUM_NAMESPACE_START

template<> struct is_error_code_enum<iam_explorer::IamExplorerError::ErrorCodes>
{
    BOOST_STATIC_CONSTANT(bool, value = true);
};

IAM_EXPLORER_ERROR_CODE_ENUM_NAMESPACE_END
