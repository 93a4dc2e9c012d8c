
//
// ===============================================================================
// clEntity, clent.h - Annotation macros for marking up entity data models.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


//
// Stringify the arguments, including commas
//
#define CLENT_STRINGIFY(...) #__VA_ARGS__


//
// Generate a unique symbol with the given prefix
//
#define CLENT_JOIN2(x, y) x ## y
#define CLENT_JOIN(x, y) CLENT_JOIN2(x, y)
#define CLENT_UNIQUE(x) CLENT_JOIN(x, __COUNTER__)


#ifdef __clent_parse__


	//
	// Native dialect attributes, attached to classes and members:
	//
	//    struct clent_attr(entity, table(name = "people")) Person
	//    {
	//        clent_attr(key, generated) int id;
	//        clent_attr(many_to_one) Address* address;
	//    };
	//
	#define clent_attr(...) __attribute__((annotate("attr:" CLENT_STRINGIFY(__VA_ARGS__))))


	//
	// Standard persistence dialect, ignored by clentgen when -generate_jpa is 0
	//
	#define clent_jpa(...) __attribute__((annotate("jpa:" CLENT_STRINGIFY(__VA_ARGS__))))


	//
	// Registers a template as a container of the given shape so that members of that type
	// are treated as collections, maps, optionals or pointers. Call from the global namespace:
	//
	//    clent_container(ds::Array, list)
	//
	// Valid shapes are: list, set, collection, map, optional, pointer
	//
	#define clent_container(container, shape)										\
		namespace clent_internal													\
		{																			\
			struct																	\
			__attribute__((annotate("container-" #container "-" #shape)))			\
			CLENT_UNIQUE(container_info) { };										\
		}


#else


	//
	// The compiler does not need to see these
	//
	#define clent_attr(...)
	#define clent_jpa(...)
	#define clent_container(container, shape)


#endif
