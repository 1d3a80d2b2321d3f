#include <ostream>

#include <sharemirror/types.h>

namespace sharemirror
{

const char* errorstring(error e)
{
    switch (e)
    {
        case API_OK:
            return "No error";
        case API_EINTERNAL:
            return "Internal error";
        case API_EARGS:
            return "Invalid argument";
        case API_EAGAIN:
            return "Request failed, retrying";
        case API_EFAILED:
            return "Request failed permanently";
        case API_ERANGE:
            return "Not available";
        case API_ENOENT:
            return "Not found";
        case API_ECIRCULAR:
            return "Circular linkage detected";
        case API_EINCOMPLETE:
            return "Incomplete transfer";
        case API_EWRITE:
            return "Write error";
        case API_EREAD:
            return "Read error";
        case LOCAL_ETIMEOUT:
            return "Timeout error";
        case LOCAL_ECANCELLED:
            return "Cancelled";
    }

    return "Unknown error";
}

const char* toString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::NONE:
            return "None";
        case ErrorKind::NOT_FOUND:
            return "NotFoundError";
        case ErrorKind::SERVICE:
            return "ServiceError";
        case ErrorKind::TRANSIENT:
            return "TransientError";
        case ErrorKind::RANGE:
            return "RangeError";
        case ErrorKind::LOCAL:
            return "LocalError";
    }

    return "UnknownError";
}

Error& Error::annotate(const std::string& where)
{
    if (mMessage.empty())
        mMessage = where;
    else
        mMessage = where + ": " + mMessage;

    return *this;
}

ErrorKind Error::kind() const
{
    switch (mError)
    {
        case API_OK:
            return ErrorKind::NONE;
        case API_ENOENT:
            return ErrorKind::NOT_FOUND;
        case API_EFAILED:
        case API_ECIRCULAR:
            return ErrorKind::SERVICE;
        case API_EAGAIN:
        case LOCAL_ETIMEOUT:
            return ErrorKind::TRANSIENT;
        case API_ERANGE:
            return ErrorKind::RANGE;
        default:
            break;
    }

    return ErrorKind::LOCAL;
}

std::string Error::describe() const
{
    std::string description = toString(kind());

    description += " (";
    description += errorstring(mError);
    description += ")";

    if (!mMessage.empty())
    {
        description += ": ";
        description += mMessage;
    }

    return description;
}

std::ostream& operator<<(std::ostream& ostream, const Error& value)
{
    return ostream << value.describe();
}

} // sharemirror
