// authkeys.hpp - Parse OpenSSH authorized_keys text into KeysFile / KeyAuthorization
#pragma once
#include "authkeys/model.hpp"
#include "authkeys/errors.hpp"
#include "authkeys/key_type.hpp"
#include "authkeys/parser.hpp"
#include "authkeys/env.hpp"
