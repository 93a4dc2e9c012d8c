
//
// ===============================================================================
// clEntity, Diagnostics.h - Errors and warnings collected over a processing run.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <string>
#include <vector>


namespace clent
{
	enum Severity
	{
		SEVERITY_NOTE,
		SEVERITY_WARNING,
		SEVERITY_ERROR,
	};


	enum DiagnosticCode
	{
		DIAG_NONE,

		// Fatal for the declaration being built, which is recorded as invalid
		DIAG_MISSING_QUALIFIED_NAME,
		DIAG_UNRESOLVED_TYPE,
		DIAG_UNRESOLVED_ANNOTATION_REFERENCE,
		DIAG_INTERNAL_FAILURE,

		// Graph validation errors
		DIAG_MISSING_KEY,
		DIAG_MULTIPLE_VERSION,
		DIAG_TO_MANY_NOT_COLLECTION,
		DIAG_DANGLING_RELATIONSHIP,
		DIAG_MULTIPLE_CARDINALITY,
		DIAG_INVALID_ENTITY_NAME,

		// Graph validation warnings
		DIAG_EMPTY_ENTITY,
		DIAG_LONE_GENERATED_KEY,
		DIAG_RESERVED_TABLE_NAME,
	};


	struct Diagnostic
	{
		Diagnostic()
			: severity(SEVERITY_ERROR)
			, code(DIAG_NONE)
			, line(0)
		{
		}

		Severity severity;
		DiagnosticCode code;
		std::string message;

		// Qualified name of the entity the diagnostic is about
		std::string subject;

		// Empty when the diagnostic isn't specific to a property
		std::string property;

		std::string filename;
		int line;
	};


	typedef std::vector<Diagnostic> DiagnosticList;


	const char* GetDiagnosticCodeName(DiagnosticCode code);

	bool HasErrors(const DiagnosticList& diagnostics);
	size_t CountDiagnostics(const DiagnosticList& diagnostics, DiagnosticCode code);

	//
	// Prints everything to the 'diag' log in the "file(line) : error - message" format that
	// IDEs understand
	//
	void PrintDiagnostics(const DiagnosticList& diagnostics);
}
