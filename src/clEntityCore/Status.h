
//
// ===============================================================================
// clEntity, Status.h - Success/skip/failure results returned across component
// boundaries.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "Diagnostics.h"

#include <string>


namespace clent
{
	//
	// A default-constructed status is success. A failure carries the diagnostic code
	// it should be reported as; a skip is a silent failure that's never reported.
	//
	struct Status
	{
		Status()
			: code(DIAG_NONE)
			, skipped(false)
		{
		}

		static Status Fail(DiagnosticCode code, const std::string& message)
		{
			Status status;
			status.code = code;
			status.message = message;
			return status;
		}

		static Status JoinFail(const Status& older, const std::string& message)
		{
			if (older.IsSkip())
				return older;

			// Add the message before concatenating with the older ones
			Status status;
			status.code = older.code;
			status.message = message + "; " + older.message;
			return status;
		}

		static Status Skip()
		{
			Status status;
			status.skipped = true;
			return status;
		}

		bool IsOk() const
		{
			return code == DIAG_NONE && !skipped;
		}

		bool IsSkip() const
		{
			return skipped;
		}

		bool HasFailed() const
		{
			return code != DIAG_NONE;
		}

		DiagnosticCode code;
		std::string message;
		bool skipped;
	};
}
